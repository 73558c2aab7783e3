// src/common/network/https/src/HttpsChannel.cpp
#include "common/network/https/include/HttpsChannel.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <chrono>

namespace secret_env::network::https
{
    HttpsChannel::HttpsChannel(const ChannelConfig& config, std::unique_ptr<tls::TlsContext> tls_ctx)
        : config_(config)
        , ioc_()
        , tls_ctx_(std::move(tls_ctx))
        , resolver_(ioc_)
        , stream_(ioc_, tls_ctx_->Native())
    {
    }

    HttpsChannel::~HttpsChannel()
    {
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(stream_).socket();
        if (!socket.is_open()) {
            return;
        }

        // 이미 끊겼을 수 있으므로 shutdown/close 에러는 무시
        // NOLINTNEXTLINE(bugprone-unused-return-value)
        socket.shutdown(tcp::socket::shutdown_both, ec);
        // NOLINTNEXTLINE(bugprone-unused-return-value)
        socket.close(ec);
    }

    std::unique_ptr<HttpsChannel> HttpsChannel::Connect(
        const ChannelConfig& config,
        std::unique_ptr<tls::TlsContext> tls_ctx
    ) {
        if (!tls_ctx || !tls_ctx->HasCA()) {
            throw vault::TransportException("TLS context without trusted roots for " + config.host);
        }

        std::unique_ptr<HttpsChannel> channel(new HttpsChannel(config, std::move(tls_ctx)));
        channel->Open();
        return channel;
    }

    void HttpsChannel::Open()
    {
        LOG_DEBUGF("HttpsChannel", "Connecting to %s:%u", config_.host.c_str(), static_cast<unsigned>(config_.port));

        SSL* ssl = stream_.native_handle();

        // SNI
        if (!SSL_set_tlsext_host_name(ssl, config_.host.c_str())) {
            throw vault::TransportException("failed to set SNI for " + config_.host + ": " +
                                            tls::TlsContext::GetLastError());
        }

        // 서버 인증서의 SAN/CN을 대상 호스트명과 대조
        if (SSL_set1_host(ssl, config_.host.c_str()) != 1) {
            throw vault::TransportException("failed to set expected host name " + config_.host);
        }

        beast::get_lowest_layer(stream_).expires_after(std::chrono::milliseconds(config_.timeout_ms));

        resolver_.async_resolve(
            config_.host,
            std::to_string(config_.port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                OnResolve(ec, std::move(results));
            }
        );

        RunIo();
        ThrowIfFailed();

        LOG_DEBUGF("HttpsChannel", "TLS handshake with %s complete (%s)",
                   config_.host.c_str(), SSL_get_version(ssl));
    }

    void HttpsChannel::OnResolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (ec) {
            Fail("resolve", ec);
            return;
        }

        beast::get_lowest_layer(stream_).async_connect(
            results,
            [this](beast::error_code ec, const tcp::endpoint& endpoint) {
                OnConnect(ec, endpoint);
            }
        );
    }

    void HttpsChannel::OnConnect(beast::error_code ec, const tcp::endpoint& endpoint)
    {
        if (ec) {
            Fail("connect", ec);
            return;
        }

        LOG_DEBUGF("HttpsChannel", "TCP connected to %s", endpoint.address().to_string().c_str());

        stream_.async_handshake(
            asio::ssl::stream_base::client,
            [this](beast::error_code ec) {
                OnHandshake(ec);
            }
        );
    }

    void HttpsChannel::OnHandshake(beast::error_code ec)
    {
        if (ec) {
            Fail("handshake", ec);
            return;
        }
        beast::get_lowest_layer(stream_).expires_never();
    }

    HttpResponse HttpsChannel::Send(HttpRequest request)
    {
        request_ = std::move(request);
        request_.set(http::field::host, config_.host);
        request_.set(http::field::user_agent, USER_AGENT);
        request_.prepare_payload();

        parser_ = std::make_unique<http::response_parser<http::string_body>>();
        parser_->body_limit(MAX_RESPONSE_SIZE);
        buffer_.clear();

        beast::get_lowest_layer(stream_).expires_after(std::chrono::milliseconds(config_.timeout_ms));

        http::async_write(
            stream_,
            request_,
            [this](beast::error_code ec, std::size_t bytes) {
                OnWrite(ec, bytes);
            }
        );

        RunIo();
        ThrowIfFailed();

        beast::get_lowest_layer(stream_).expires_never();
        return parser_->release();
    }

    void HttpsChannel::OnWrite(beast::error_code ec, std::size_t bytes_transferred)
    {
        if (ec) {
            Fail("write", ec);
            return;
        }

        LOG_DEBUGF("HttpsChannel", "Sent %zu bytes to %s", bytes_transferred, config_.host.c_str());

        http::async_read(
            stream_,
            buffer_,
            *parser_,
            [this](beast::error_code ec, std::size_t bytes) {
                OnRead(ec, bytes);
            }
        );
    }

    void HttpsChannel::OnRead(beast::error_code ec, std::size_t bytes_transferred)
    {
        if (ec) {
            Fail("read", ec);
            return;
        }
        LOG_DEBUGF("HttpsChannel", "Received %zu bytes from %s", bytes_transferred, config_.host.c_str());
    }

    void HttpsChannel::RunIo()
    {
        error_ = {};
        failed_stage_ = nullptr;
        ioc_.restart();
        ioc_.run();
    }

    void HttpsChannel::Fail(const char* stage, beast::error_code ec)
    {
        failed_stage_ = stage;
        error_ = ec;
        LOG_ERRORF("HttpsChannel", "%s %s:%u failed: %s",
                   stage, config_.host.c_str(), static_cast<unsigned>(config_.port), ec.message().c_str());
    }

    void HttpsChannel::ThrowIfFailed()
    {
        if (!failed_stage_) {
            return;
        }

        std::string message = std::string(failed_stage_) + " " + config_.host + ":" +
                              std::to_string(config_.port) + " failed: " + error_.message();

        if (error_ == beast::error::timeout) {
            message += " (timeout " + std::to_string(config_.timeout_ms) + " ms)";
        }
        throw vault::TransportException(message);
    }

} // namespace secret_env::network::https
