// src/common/network/https/include/HttpChannel.hpp
#pragma once
#include "common/network/https/include/IHttpChannel.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string>

namespace secret_env::network::https
{
    namespace beast = boost::beast;
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    /**
     * @brief 평문 HTTP 채널
     *
     * 링크 로컬 메타데이터 서버(metadata.google.internal) 전용
     * 시크릿 조회에는 절대 사용하지 않음
     * 타임아웃 범위는 HttpsChannel과 동일 (이름 해석 제외)
     */
    class HttpChannel : public IHttpChannel
    {
    public:
        /**
         * @throws TransportException 이름 해석 또는 연결 실패
         */
        static std::unique_ptr<HttpChannel> Connect(const ChannelConfig& config);

        ~HttpChannel() override;

        HttpChannel(const HttpChannel&) = delete;
        HttpChannel& operator=(const HttpChannel&) = delete;

        HttpResponse Send(HttpRequest request) override;
        const std::string& GetHost() const override { return config_.host; }

    private:
        explicit HttpChannel(const ChannelConfig& config);

        void Open();
        void RunIo();
        void Fail(const char* stage, beast::error_code ec);
        void ThrowIfFailed();

    private:
        ChannelConfig config_;
        asio::io_context ioc_;
        tcp::resolver resolver_;
        beast::tcp_stream stream_;

        beast::flat_buffer buffer_;
        HttpRequest request_;
        std::unique_ptr<http::response_parser<http::string_body>> parser_;

        beast::error_code error_;
        const char* failed_stage_ = nullptr;
    };

} // namespace secret_env::network::https
