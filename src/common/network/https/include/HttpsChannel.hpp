// src/common/network/https/include/HttpsChannel.hpp
#pragma once
#include "common/network/https/include/IHttpChannel.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <memory>
#include <string>

namespace secret_env::network::https
{
    namespace beast = boost::beast;
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    /**
     * @brief TLS 채널 (boost.beast 기반)
     *
     * 채널마다 io_context를 하나 소유하고, 비동기 연산(resolve, connect,
     * handshake, write, read)을 등록한 뒤 완료될 때까지 run()으로 구동
     * 외부에는 블로킹 API만 노출
     *
     * 서버 인증서는 TlsContext의 루트로 검증하고, 호스트명은 config.host와 대조
     *
     * config.timeout_ms는 connect, handshake, write, read에 적용
     * 이름 해석(getaddrinfo)은 중단할 수 없으므로 시스템 resolver 타임아웃을 따름
     */
    class HttpsChannel : public IHttpChannel
    {
    public:
        /**
         * @brief 연결 + TLS 핸드셰이크까지 완료된 채널 생성
         * @throws TransportException 이름 해석, 연결, 핸드셰이크, 인증서 검증 실패
         */
        static std::unique_ptr<HttpsChannel> Connect(
            const ChannelConfig& config,
            std::unique_ptr<tls::TlsContext> tls_ctx
        );

        ~HttpsChannel() override;

        HttpsChannel(const HttpsChannel&) = delete;
        HttpsChannel& operator=(const HttpsChannel&) = delete;

        HttpResponse Send(HttpRequest request) override;
        const std::string& GetHost() const override { return config_.host; }

    private:
        HttpsChannel(const ChannelConfig& config, std::unique_ptr<tls::TlsContext> tls_ctx);

        void Open();
        void OnResolve(beast::error_code ec, tcp::resolver::results_type results);
        void OnConnect(beast::error_code ec, const tcp::endpoint& endpoint);
        void OnHandshake(beast::error_code ec);
        void OnWrite(beast::error_code ec, std::size_t bytes_transferred);
        void OnRead(beast::error_code ec, std::size_t bytes_transferred);

        void RunIo();
        void Fail(const char* stage, beast::error_code ec);
        void ThrowIfFailed();

    private:
        ChannelConfig config_;
        asio::io_context ioc_;
        std::unique_ptr<tls::TlsContext> tls_ctx_;
        tcp::resolver resolver_;
        beast::ssl_stream<beast::tcp_stream> stream_;

        beast::flat_buffer buffer_;
        HttpRequest request_;
        std::unique_ptr<http::response_parser<http::string_body>> parser_;

        beast::error_code error_;
        const char* failed_stage_ = nullptr;
    };

} // namespace secret_env::network::https
