// src/common/rpc/src/SecretManagerClient.cpp
#include "common/rpc/include/SecretManagerClient.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <google/protobuf/util/json_util.h>

namespace secret_env::rpc
{
    using namespace network::https;

    std::unique_ptr<SecretManagerClient> SecretManagerClient::WithInterceptor(
        std::unique_ptr<IHttpChannel> channel,
        RequestInterceptor interceptor)
    {
        return std::unique_ptr<SecretManagerClient>(
            new SecretManagerClient(std::move(channel), std::move(interceptor)));
    }

    SecretManagerClient::SecretManagerClient(std::unique_ptr<IHttpChannel> channel,
                                             RequestInterceptor interceptor)
        : channel_(std::move(channel))
        , interceptor_(std::move(interceptor))
    {
    }

    sm::AccessSecretVersionResponse SecretManagerClient::AccessSecretVersion(
        const sm::AccessSecretVersionRequest& request)
    {
        HttpRequest http_request{http::verb::get, "/v1/" + request.name() + ":access", 11};
        http_request.set(http::field::accept, "application/json");

        HttpResponse http_response = Call(std::move(http_request));

        sm::AccessSecretVersionResponse response;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        auto status = google::protobuf::util::JsonStringToMessage(http_response.body(), &response, options);
        if (!status.ok()) {
            LOG_ERRORF("SecretManagerClient", "Malformed AccessSecretVersion response for %s",
                       request.name().c_str());
            throw vault::RemoteCallException(RpcStatus(
                StatusCode::INTERNAL,
                "malformed AccessSecretVersion response: " + status.ToString()));
        }

        return response;
    }

    HttpResponse SecretManagerClient::Call(HttpRequest request)
    {
        if (interceptor_) {
            RpcStatus status = interceptor_(request);
            if (!status.IsOk()) {
                throw vault::RemoteCallException(status);
            }
        }

        std::string target(request.target());
        HttpResponse response = channel_->Send(std::move(request));

        int http_status = static_cast<int>(response.result_int());
        if (http_status < 200 || http_status >= 300) {
            RpcStatus status = StatusFromErrorBody(http_status, response.body());
            LOG_WARNF("SecretManagerClient", "%s -> HTTP %d %s",
                      target.c_str(), http_status, StatusCodeToString(status.code));
            throw vault::RemoteCallException(status);
        }

        LOG_DEBUGF("SecretManagerClient", "%s -> HTTP %d", target.c_str(), http_status);
        return response;
    }

    RpcStatus SecretManagerClient::StatusFromErrorBody(int http_status, const std::string& body)
    {
        sm::ErrorResponse error;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        if (google::protobuf::util::JsonStringToMessage(body, &error, options).ok() && error.has_error()) {
            const sm::ErrorStatus& detail = error.error();

            StatusCode code = detail.status().empty()
                ? StatusCodeFromHttp(http_status)
                : StatusCodeFromString(detail.status());

            std::string message = detail.message().empty()
                ? "HTTP " + std::to_string(http_status)
                : detail.message();
            return RpcStatus(code, message);
        }

        return RpcStatus(StatusCodeFromHttp(http_status), "HTTP " + std::to_string(http_status));
    }

} // namespace secret_env::rpc
