// src/common/network/https/src/HttpChannel.cpp
#include "common/network/https/include/HttpChannel.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <chrono>

namespace secret_env::network::https
{
    HttpChannel::HttpChannel(const ChannelConfig& config)
        : config_(config)
        , ioc_()
        , resolver_(ioc_)
        , stream_(ioc_)
    {
    }

    HttpChannel::~HttpChannel()
    {
        beast::error_code ec;
        if (!stream_.socket().is_open()) {
            return;
        }
        // NOLINTNEXTLINE(bugprone-unused-return-value)
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        // NOLINTNEXTLINE(bugprone-unused-return-value)
        stream_.socket().close(ec);
    }

    std::unique_ptr<HttpChannel> HttpChannel::Connect(const ChannelConfig& config)
    {
        std::unique_ptr<HttpChannel> channel(new HttpChannel(config));
        channel->Open();
        return channel;
    }

    void HttpChannel::Open()
    {
        stream_.expires_after(std::chrono::milliseconds(config_.timeout_ms));

        resolver_.async_resolve(
            config_.host,
            std::to_string(config_.port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    Fail("resolve", ec);
                    return;
                }
                stream_.async_connect(
                    results,
                    [this](beast::error_code ec, const tcp::endpoint&) {
                        if (ec) {
                            Fail("connect", ec);
                        }
                    }
                );
            }
        );

        RunIo();
        ThrowIfFailed();
        stream_.expires_never();
    }

    HttpResponse HttpChannel::Send(HttpRequest request)
    {
        request_ = std::move(request);
        request_.set(http::field::host, config_.host);
        request_.set(http::field::user_agent, USER_AGENT);
        request_.prepare_payload();

        parser_ = std::make_unique<http::response_parser<http::string_body>>();
        parser_->body_limit(MAX_RESPONSE_SIZE);
        buffer_.clear();

        stream_.expires_after(std::chrono::milliseconds(config_.timeout_ms));

        http::async_write(
            stream_,
            request_,
            [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    Fail("write", ec);
                    return;
                }
                http::async_read(
                    stream_,
                    buffer_,
                    *parser_,
                    [this](beast::error_code ec, std::size_t) {
                        if (ec) {
                            Fail("read", ec);
                        }
                    }
                );
            }
        );

        RunIo();
        ThrowIfFailed();

        stream_.expires_never();
        return parser_->release();
    }

    void HttpChannel::RunIo()
    {
        error_ = {};
        failed_stage_ = nullptr;
        ioc_.restart();
        ioc_.run();
    }

    void HttpChannel::Fail(const char* stage, beast::error_code ec)
    {
        failed_stage_ = stage;
        error_ = ec;
        LOG_WARNF("HttpChannel", "%s %s:%u failed: %s",
                  stage, config_.host.c_str(), static_cast<unsigned>(config_.port), ec.message().c_str());
    }

    void HttpChannel::ThrowIfFailed()
    {
        if (failed_stage_) {
            throw vault::TransportException(std::string(failed_stage_) + " " + config_.host + ":" +
                                            std::to_string(config_.port) + " failed: " + error_.message());
        }
    }

} // namespace secret_env::network::https
