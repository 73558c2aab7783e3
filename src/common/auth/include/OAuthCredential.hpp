// src/common/auth/include/OAuthCredential.hpp
#pragma once
#include "common/auth/include/ICredential.hpp"
#include "common/network/https/include/IHttpChannel.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace secret_env::auth
{
    constexpr const char* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";
    constexpr const char* CLOUD_PLATFORM_SCOPE = "https://www.googleapis.com/auth/cloud-platform";

    // 만료 직전 토큰은 재발급
    constexpr int64_t TOKEN_REFRESH_MARGIN_SEC = 60;

    /**
     * @brief 토큰 엔드포인트 응답
     */
    struct AccessToken
    {
        std::string token;
        std::string token_type = "Bearer";
        int64_t expires_in_sec = 0;
    };

    /**
     * @brief OAuth2 토큰 기반 자격 증명 공통 구현
     *
     * 토큰은 인스턴스 안에서만 캐시됨
     * (Vault는 호출마다 새 자격 증명을 만들므로 호출 간 공유되지 않음)
     */
    class OAuthCredential : public ICredential
    {
    public:
        explicit OAuthCredential(network::https::ChannelFactory channel_factory);
        ~OAuthCredential() override = default;

        std::string HeaderValue() override;

        /**
         * @brief 토큰 응답 본문 파싱
         * @throws RemoteCallException access_token이 없거나 JSON이 아닐 때
         */
        static AccessToken ParseTokenResponse(const std::string& body);

    protected:
        /**
         * @brief 토큰 엔드포인트 호출 (구현체별)
         */
        virtual AccessToken FetchToken() = 0;

        /**
         * @brief application/x-www-form-urlencoded POST
         */
        AccessToken PostForm(const std::string& token_uri, const std::string& form_body);

        /**
         * @brief 요청 전송 후 2xx면 토큰 파싱, 아니면 RemoteCallException
         */
        AccessToken Exchange(const network::https::ChannelConfig& endpoint,
                             network::https::HttpRequest request);

    private:
        network::https::ChannelFactory channel_factory_;
        AccessToken cached_;
        std::chrono::steady_clock::time_point expires_at_{};
    };

} // namespace secret_env::auth
