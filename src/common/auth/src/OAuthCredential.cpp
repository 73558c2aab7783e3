// src/common/auth/src/OAuthCredential.cpp
#include "common/auth/include/OAuthCredential.hpp"
#include "common/network/https/include/Url.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>

namespace secret_env::auth
{
    using namespace network::https;

    OAuthCredential::OAuthCredential(ChannelFactory channel_factory)
        : channel_factory_(std::move(channel_factory))
    {
    }

    std::string OAuthCredential::HeaderValue()
    {
        auto now = std::chrono::steady_clock::now();
        if (cached_.token.empty() || now >= expires_at_) {
            cached_ = FetchToken();

            int64_t lifetime = cached_.expires_in_sec - TOKEN_REFRESH_MARGIN_SEC;
            if (lifetime < 0) {
                lifetime = 0;
            }
            expires_at_ = now + std::chrono::seconds(lifetime);
            LOG_DEBUGF("OAuthCredential", "Obtained %s access token (expires in %lld s)",
                       Type(), static_cast<long long>(cached_.expires_in_sec));
        }
        return "Bearer " + cached_.token;
    }

    AccessToken OAuthCredential::ParseTokenResponse(const std::string& body)
    {
        nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            throw vault::RemoteCallException(
                rpc::RpcStatus(rpc::StatusCode::INTERNAL, "token endpoint returned invalid JSON"));
        }

        auto token_it = parsed.find("access_token");
        if (token_it == parsed.end() || !token_it->is_string() ||
            token_it->get<std::string>().empty()) {
            throw vault::RemoteCallException(
                rpc::RpcStatus(rpc::StatusCode::INTERNAL, "token response has no access_token"));
        }

        AccessToken result;
        result.token = token_it->get<std::string>();

        auto type_it = parsed.find("token_type");
        if (type_it != parsed.end() && type_it->is_string()) {
            result.token_type = type_it->get<std::string>();
        }

        auto expires_it = parsed.find("expires_in");
        if (expires_it != parsed.end() && expires_it->is_number_integer()) {
            result.expires_in_sec = expires_it->get<int64_t>();
        }

        return result;
    }

    AccessToken OAuthCredential::PostForm(const std::string& token_uri, const std::string& form_body)
    {
        Url url = Url::Parse(token_uri);

        HttpRequest request{http::verb::post, url.target, 11};
        request.set(http::field::content_type, "application/x-www-form-urlencoded");
        request.set(http::field::accept, "application/json");
        request.body() = form_body;

        return Exchange(url.ToChannelConfig(), std::move(request));
    }

    AccessToken OAuthCredential::Exchange(const ChannelConfig& endpoint, HttpRequest request)
    {
        std::unique_ptr<IHttpChannel> channel = channel_factory_(endpoint);
        HttpResponse response = channel->Send(std::move(request));

        unsigned status = response.result_int();
        if (status < 200 || status >= 300) {
            std::string message = "token endpoint " + endpoint.host + " returned HTTP " +
                                  std::to_string(status);

            nlohmann::json error = nlohmann::json::parse(response.body(), nullptr, false);
            if (error.is_object()) {
                auto desc_it = error.find("error_description");
                auto err_it = error.find("error");
                if (desc_it != error.end() && desc_it->is_string()) {
                    message += ": " + desc_it->get<std::string>();
                } else if (err_it != error.end() && err_it->is_string()) {
                    message += ": " + err_it->get<std::string>();
                }
            }

            LOG_WARNF("OAuthCredential", "%s", message.c_str());
            throw vault::RemoteCallException(
                rpc::RpcStatus(rpc::StatusCodeFromHttp(static_cast<int>(status)), message));
        }

        return ParseTokenResponse(response.body());
    }

} // namespace secret_env::auth
