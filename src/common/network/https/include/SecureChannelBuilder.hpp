// src/common/network/https/include/SecureChannelBuilder.hpp
#pragma once
#include "common/network/https/include/IHttpChannel.hpp"
#include <memory>

namespace secret_env::network::https
{
    constexpr const char* SECRET_MANAGER_HOST = "secretmanager.googleapis.com";

    /**
     * @brief 채널 생성기
     *
     * TLS 채널은 항상 컴파일 시 포함된 루트 인증서만 신뢰
     * 호출마다 새 TlsContext와 새 연결을 만들고 아무것도 캐시하지 않음
     */
    class SecureChannelBuilder
    {
    public:
        /**
         * @brief Secret Manager 엔드포인트 (secretmanager.googleapis.com:443)
         */
        static ChannelConfig SecretManagerEndpoint(uint32_t timeout_ms = DEFAULT_TIMEOUT_MS);

        /**
         * @brief 채널 생성 (use_tls=false면 평문 채널)
         * @throws TransportException 연결 또는 핸드셰이크 실패
         */
        static std::unique_ptr<IHttpChannel> Build(const ChannelConfig& config);

        /**
         * @brief Build를 감싼 기본 ChannelFactory
         */
        static ChannelFactory DefaultFactory();

    private:
        SecureChannelBuilder() = delete;
    };

} // namespace secret_env::network::https
