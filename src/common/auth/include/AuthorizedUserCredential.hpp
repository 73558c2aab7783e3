// src/common/auth/include/AuthorizedUserCredential.hpp
#pragma once
#include "common/auth/include/OAuthCredential.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace secret_env::auth
{
    /**
     * @brief "authorized_user" 자격 증명 (gcloud auth application-default login)
     *
     * refresh_token으로 access token 교환
     */
    class AuthorizedUserCredential : public OAuthCredential
    {
    public:
        /**
         * @throws ConfigurationException client_id, client_secret, refresh_token 누락
         */
        AuthorizedUserCredential(const nlohmann::json& info,
                                 network::https::ChannelFactory channel_factory);

        const char* Type() const override { return "authorized_user"; }

        std::string BuildRefreshForm() const;

    protected:
        AccessToken FetchToken() override;

    private:
        std::string client_id_;
        std::string client_secret_;
        std::string refresh_token_;
        std::string token_uri_;
    };

} // namespace secret_env::auth
