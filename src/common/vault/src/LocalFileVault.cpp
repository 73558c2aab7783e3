// src/common/vault/src/LocalFileVault.cpp
#include "common/vault/include/LocalFileVault.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/env/include/EnvDecoder.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>

namespace secret_env::vault
{
    LocalFileVault::LocalFileVault(std::filesystem::path root_dir)
        : root_dir_(std::move(root_dir))
    {
    }

    EnvEntries LocalFileVault::DownloadPrefixed(const std::string& prefix) const
    {
        throw UnimplementedException("download_prefixed is not implemented for the local vault (prefix '" +
                                     prefix + "')");
    }

    std::filesystem::path LocalFileVault::SecretPath(const std::string& secret_name) const
    {
        if (secret_name.empty()) {
            throw ConfigurationException("secret name is empty");
        }
        if (secret_name.find('/') != std::string::npos ||
            secret_name.find('\\') != std::string::npos ||
            secret_name.find("..") != std::string::npos) {
            throw ConfigurationException("invalid secret name: " + secret_name);
        }
        return root_dir_ / (secret_name + ".json");
    }

    EnvEntries LocalFileVault::DownloadJson(const std::string& secret_name) const
    {
        std::filesystem::path path = SecretPath(secret_name);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw RemoteCallException(rpc::RpcStatus(
                rpc::StatusCode::NOT_FOUND, "secret file not found: " + path.string()));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw RemoteCallException(rpc::RpcStatus(
                rpc::StatusCode::NOT_FOUND, "cannot open secret file: " + path.string()));
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string data = buffer.str();

        if (data.empty()) {
            throw EmptySecretException(secret_name);
        }

        nlohmann::ordered_json value = env::EnvDecoder::ParsePayload(secret_name, data);
        EnvEntries entries = env::EnvDecoder::DecodeEnvFromJson(secret_name, value);

        LOG_INFOF("LocalFileVault", "Loaded %zu entries from %s", entries.size(), path.c_str());
        return entries;
    }

} // namespace secret_env::vault
