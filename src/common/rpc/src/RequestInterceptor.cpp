// src/common/rpc/src/RequestInterceptor.cpp
#include "common/rpc/include/RequestInterceptor.hpp"
#include "common/utils/logger/Logger.hpp"
#include <exception>

namespace secret_env::rpc
{
    RequestInterceptor MakeBearerTokenInterceptor(std::shared_ptr<auth::ICredential> credential)
    {
        return [credential](network::https::HttpRequest& request) -> RpcStatus {
            std::string header_value;
            try {
                header_value = credential->HeaderValue();
            } catch (const std::exception& e) {
                LOG_WARNF("BearerTokenInterceptor", "Failed to render %s credential: %s",
                          credential->Type(), e.what());
                return RpcStatus::Unknown(e.what());
            }

            request.set(network::https::http::field::authorization, header_value);
            return RpcStatus::Ok();
        };
    }

} // namespace secret_env::rpc
