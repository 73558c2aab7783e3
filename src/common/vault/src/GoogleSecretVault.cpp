// src/common/vault/src/GoogleSecretVault.cpp
#include "common/vault/include/GoogleSecretVault.hpp"
#include "common/vault/include/SecretReference.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/auth/include/CredentialProvider.hpp"
#include "common/env/include/EnvDecoder.hpp"
#include "common/network/https/include/SecureChannelBuilder.hpp"
#include "common/rpc/include/SecretManagerClient.hpp"
#include "common/utils/logger/Logger.hpp"
#include <boost/crc.hpp>

namespace secret_env::vault
{
    using network::https::SecureChannelBuilder;

    GoogleSecretVault::GoogleSecretVault(std::string project,
                                         std::optional<std::filesystem::path> credentials_file)
        : GoogleSecretVault(
              std::move(project),
              std::move(credentials_file),
              [](const std::optional<std::filesystem::path>& file) {
                  return auth::CredentialProvider::Resolve(file, SecureChannelBuilder::DefaultFactory());
              },
              SecureChannelBuilder::DefaultFactory())
    {
    }

    GoogleSecretVault::GoogleSecretVault(std::string project,
                                         std::optional<std::filesystem::path> credentials_file,
                                         CredentialResolver credential_resolver,
                                         network::https::ChannelFactory channel_factory)
        : project_(std::move(project))
        , credentials_file_(std::move(credentials_file))
        , credential_resolver_(std::move(credential_resolver))
        , channel_factory_(std::move(channel_factory))
    {
    }

    EnvEntries GoogleSecretVault::DownloadPrefixed(const std::string& prefix) const
    {
        throw UnimplementedException("download_prefixed is not implemented for Google Secret Manager (prefix '" +
                                     prefix + "')");
    }

    EnvEntries GoogleSecretVault::DownloadJson(const std::string& secret_name) const
    {
        SecretReference ref(project_, secret_name);
        ref.Validate();

        // 1. 자격 증명 (채널 생성 전에 확인)
        std::shared_ptr<auth::ICredential> credential = credential_resolver_(credentials_file_);
        if (!credential) {
            throw ConfigurationException("no credential available");
        }

        // 2. 채널 + 인증 클라이언트
        std::unique_ptr<network::https::IHttpChannel> channel =
            channel_factory_(SecureChannelBuilder::SecretManagerEndpoint());
        if (!channel) {
            throw TransportException("channel factory returned no channel");
        }

        auto client = rpc::SecretManagerClient::WithInterceptor(
            std::move(channel), rpc::MakeBearerTokenInterceptor(credential));

        // 3. 원격 호출
        rpc::sm::AccessSecretVersionRequest request;
        request.set_name(ref.ToResourceName());

        LOG_DEBUGF("GoogleSecretVault", "Accessing %s (%s credential)",
                   request.name().c_str(), credential->Type());

        rpc::sm::AccessSecretVersionResponse response = client->AccessSecretVersion(request);

        // 4. payload 검증
        if (!response.has_payload() || response.payload().data().empty()) {
            throw EmptySecretException(secret_name);
        }

        const std::string& data = response.payload().data();
        if (response.payload().has_data_crc32c()) {
            int64_t actual = static_cast<int64_t>(Crc32c(data));
            if (actual != response.payload().data_crc32c()) {
                throw PayloadCorruptedException(
                    "CRC32C mismatch for " + secret_name + " (expected " +
                    std::to_string(response.payload().data_crc32c()) + ", got " +
                    std::to_string(actual) + ")");
            }
        }

        // 5. 디코딩
        nlohmann::ordered_json value = env::EnvDecoder::ParsePayload(secret_name, data);
        EnvEntries entries = env::EnvDecoder::DecodeEnvFromJson(secret_name, value);

        LOG_INFOF("GoogleSecretVault", "Loaded %zu entries from %s", entries.size(), secret_name.c_str());
        return entries;
    }

    uint32_t GoogleSecretVault::Crc32c(const std::string& data)
    {
        boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true> crc;
        crc.process_bytes(data.data(), data.size());
        return crc.checksum();
    }

} // namespace secret_env::vault
