// src/common/auth/include/CredentialProvider.hpp
#pragma once
#include "common/auth/include/ICredential.hpp"
#include "common/network/https/include/IHttpChannel.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>

namespace secret_env::auth
{
    constexpr const char* CREDENTIALS_ENV_VAR = "GOOGLE_APPLICATION_CREDENTIALS";
    constexpr const char* WELL_KNOWN_CREDENTIALS_FILE = ".config/gcloud/application_default_credentials.json";

    /**
     * @brief 자격 증명 확인
     *
     * 명시적 파일이 있으면 그 파일만 사용
     * 없으면 순서대로 탐색:
     *   1. GOOGLE_APPLICATION_CREDENTIALS
     *   2. $HOME/.config/gcloud/application_default_credentials.json
     *   3. 메타데이터 서버
     *
     * 로컬 파일/환경 변수만 확인하며 네트워크는 사용하지 않음
     * 토큰 발급은 HeaderValue() 호출 시점으로 미뤄짐
     */
    class CredentialProvider
    {
    public:
        /**
         * @throws ConfigurationException 파일 없음, 형식 오류, 필드 누락, 알 수 없는 type
         */
        static std::shared_ptr<ICredential> Resolve(
            const std::optional<std::filesystem::path>& credentials_file,
            network::https::ChannelFactory channel_factory);

        /**
         * @brief 파싱된 자격 증명 JSON의 "type"에 따라 구현체 생성
         */
        static std::shared_ptr<ICredential> FromJson(const nlohmann::json& info,
                                                     network::https::ChannelFactory channel_factory);

        static std::shared_ptr<ICredential> FromFile(const std::filesystem::path& path,
                                                     network::https::ChannelFactory channel_factory);

    private:
        CredentialProvider() = delete;
    };

} // namespace secret_env::auth
