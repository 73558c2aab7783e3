// src/common/network/https/include/IHttpChannel.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <boost/beast/http.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace secret_env::network::https
{
    namespace http = boost::beast::http;

    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    /**
     * @brief 채널 연결 대상 설정
     */
    struct ChannelConfig
    {
        std::string host;
        uint16_t port = DEFAULT_HTTPS_PORT;
        bool use_tls = true;
        uint32_t timeout_ms = DEFAULT_TIMEOUT_MS;
    };

    /**
     * @brief 하나의 원격 엔드포인트에 연결된 HTTP 채널
     *
     * 생성 시점에 연결(및 TLS 핸드셰이크)이 완료되어 있어야 함
     * 소멸 시 연결 종료
     */
    class IHttpChannel
    {
    public:
        virtual ~IHttpChannel() = default;

        /**
         * @brief 요청 전송 후 응답 수신 (블로킹)
         *
         * Host, User-Agent 헤더는 채널이 채움
         * @throws TransportException 송수신 실패 또는 타임아웃
         */
        virtual HttpResponse Send(HttpRequest request) = 0;

        virtual const std::string& GetHost() const = 0;
    };

    /**
     * @brief 채널 생성 함수 (테스트에서 대체 가능)
     */
    using ChannelFactory = std::function<std::unique_ptr<IHttpChannel>(const ChannelConfig&)>;

    constexpr const char* USER_AGENT = "secret-env/1.0";

} // namespace secret_env::network::https
