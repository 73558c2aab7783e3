// src/common/auth/src/AuthorizedUserCredential.cpp
#include "common/auth/include/AuthorizedUserCredential.hpp"
#include "common/auth/include/CredentialFile.hpp"
#include "common/network/https/include/Url.hpp"

namespace secret_env::auth
{
    AuthorizedUserCredential::AuthorizedUserCredential(const nlohmann::json& info,
                                                       network::https::ChannelFactory channel_factory)
        : OAuthCredential(std::move(channel_factory))
        , client_id_(RequireString(info, "client_id"))
        , client_secret_(RequireString(info, "client_secret"))
        , refresh_token_(RequireString(info, "refresh_token"))
        , token_uri_(HttpsUrlField(info, "token_uri", DEFAULT_TOKEN_URI))
    {
    }

    std::string AuthorizedUserCredential::BuildRefreshForm() const
    {
        using network::https::FormUrlEncode;
        return "grant_type=refresh_token"
               "&client_id=" + FormUrlEncode(client_id_) +
               "&client_secret=" + FormUrlEncode(client_secret_) +
               "&refresh_token=" + FormUrlEncode(refresh_token_);
    }

    AccessToken AuthorizedUserCredential::FetchToken()
    {
        return PostForm(token_uri_, BuildRefreshForm());
    }

} // namespace secret_env::auth
