// src/common/rpc/include/SecretManagerClient.hpp
#pragma once
#include "common/rpc/include/RequestInterceptor.hpp"
#include "common/network/https/include/IHttpChannel.hpp"
#include "proto/secretmanager/secret_manager.pb.h"
#include <memory>
#include <string>

namespace secret_env::rpc
{
    namespace sm = secret_env::proto::secretmanager;

    /**
     * @brief Secret Manager v1 REST 클라이언트
     *
     * 채널을 독점 소유하며 클라이언트 소멸 시 채널도 종료
     * 모든 요청은 전송 직전에 인터셉터를 거침
     */
    class SecretManagerClient
    {
    public:
        /**
         * @brief 채널 + 인터셉터로 클라이언트 구성
         */
        static std::unique_ptr<SecretManagerClient> WithInterceptor(
            std::unique_ptr<network::https::IHttpChannel> channel,
            RequestInterceptor interceptor);

        ~SecretManagerClient() = default;

        SecretManagerClient(const SecretManagerClient&) = delete;
        SecretManagerClient& operator=(const SecretManagerClient&) = delete;

        /**
         * @brief GET /v1/{name}:access
         * @throws RemoteCallException 인터셉터 실패, 2xx가 아닌 응답, 응답 본문 해석 실패
         * @throws TransportException 송수신 실패
         */
        sm::AccessSecretVersionResponse AccessSecretVersion(const sm::AccessSecretVersionRequest& request);

        /**
         * @brief 에러 응답 본문에서 상태 추출
         *
         * {"error": {"code", "message", "status"}} 형태가 아니면 HTTP 상태로 매핑
         */
        static RpcStatus StatusFromErrorBody(int http_status, const std::string& body);

    private:
        SecretManagerClient(std::unique_ptr<network::https::IHttpChannel> channel,
                            RequestInterceptor interceptor);

        network::https::HttpResponse Call(network::https::HttpRequest request);

        std::unique_ptr<network::https::IHttpChannel> channel_;
        RequestInterceptor interceptor_;
    };

} // namespace secret_env::rpc
