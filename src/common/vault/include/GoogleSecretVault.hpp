// src/common/vault/include/GoogleSecretVault.hpp
#pragma once
#include "common/vault/include/IVault.hpp"
#include "common/auth/include/ICredential.hpp"
#include "common/network/https/include/IHttpChannel.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace secret_env::vault
{
    using CredentialResolver = std::function<std::shared_ptr<auth::ICredential>(
        const std::optional<std::filesystem::path>&)>;

    /**
     * @brief Google Secret Manager 백엔드
     *
     * 호출마다:
     *   자격 증명 확인 -> 채널 생성 -> 인증 클라이언트 구성
     *   -> AccessSecretVersion 1회 -> payload 검증 -> JSON 디코딩
     *
     * 호출 간 자격 증명, 채널, 시크릿을 캐시하지 않으며 재시도하지 않음
     */
    class GoogleSecretVault : public IVault
    {
    public:
        GoogleSecretVault(std::string project,
                          std::optional<std::filesystem::path> credentials_file);

        /**
         * @brief 자격 증명 확인과 채널 생성을 대체할 수 있는 생성자 (테스트용)
         */
        GoogleSecretVault(std::string project,
                          std::optional<std::filesystem::path> credentials_file,
                          CredentialResolver credential_resolver,
                          network::https::ChannelFactory channel_factory);

        ~GoogleSecretVault() override = default;

        /**
         * @throws UnimplementedException 항상
         */
        EnvEntries DownloadPrefixed(const std::string& prefix) const override;

        /**
         * @throws ConfigurationException 자격 증명 확인 실패
         * @throws TransportException 채널 생성 또는 송수신 실패
         * @throws RemoteCallException 원격 호출 실패
         * @throws EmptySecretException payload 없음
         * @throws PayloadCorruptedException CRC32C 불일치
         * @throws DecodeException JSON 해석 또는 변환 실패
         */
        EnvEntries DownloadJson(const std::string& secret_name) const override;

        const char* Name() const override { return "google"; }

        const std::string& GetProject() const { return project_; }

        /**
         * @brief CRC32C (Castagnoli)
         */
        static uint32_t Crc32c(const std::string& data);

    private:
        std::string project_;
        std::optional<std::filesystem::path> credentials_file_;
        CredentialResolver credential_resolver_;
        network::https::ChannelFactory channel_factory_;
    };

} // namespace secret_env::vault
