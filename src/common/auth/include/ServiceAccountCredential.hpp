// src/common/auth/include/ServiceAccountCredential.hpp
#pragma once
#include "common/auth/include/OAuthCredential.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <cstdint>
#include <string>

namespace secret_env::auth
{
    /**
     * @brief "service_account" 자격 증명 파일
     *
     * RS256으로 서명한 JWT assertion을 token_uri에 제출해
     * access token을 교환 (urn:ietf:params:oauth:grant-type:jwt-bearer)
     */
    class ServiceAccountCredential : public OAuthCredential
    {
    public:
        /**
         * @param info 파싱된 자격 증명 파일
         * @throws ConfigurationException 필수 필드 누락 또는 private_key 파싱 실패
         */
        ServiceAccountCredential(const nlohmann::json& info,
                                 network::https::ChannelFactory channel_factory);
        ~ServiceAccountCredential() override;

        ServiceAccountCredential(const ServiceAccountCredential&) = delete;
        ServiceAccountCredential& operator=(const ServiceAccountCredential&) = delete;

        const char* Type() const override { return "service_account"; }

        /**
         * @brief 서명된 JWT assertion 생성
         * @param issued_at iat (unix seconds), exp = iat + 3600
         */
        std::string BuildAssertion(int64_t issued_at) const;

    protected:
        AccessToken FetchToken() override;

    private:
        std::string client_email_;
        std::string private_key_id_;
        std::string token_uri_;
        EVP_PKEY* private_key_ = nullptr;
    };

} // namespace secret_env::auth
