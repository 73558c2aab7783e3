// tests/unit/fakes/FakeHttpChannel.hpp
#pragma once
#include "common/network/https/include/IHttpChannel.hpp"
#include "common/vault/include/VaultException.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace secret_env::test
{
    using namespace secret_env::network::https;

    /**
     * @brief 채널 팩토리가 만든 채널들이 공유하는 기록
     */
    struct ChannelLog
    {
        std::vector<ChannelConfig> built;
        std::vector<HttpRequest> sent;
        std::deque<HttpResponse> responses;
        bool fail_build = false;
        bool fail_send = false;
    };

    inline HttpResponse MakeResponse(http::status status, const std::string& body)
    {
        HttpResponse response{status, 11};
        response.set(http::field::content_type, "application/json");
        response.body() = body;
        response.prepare_payload();
        return response;
    }

    class FakeHttpChannel : public IHttpChannel
    {
    public:
        FakeHttpChannel(ChannelConfig config, std::shared_ptr<ChannelLog> log)
            : config_(std::move(config)), log_(std::move(log)) {}

        HttpResponse Send(HttpRequest request) override
        {
            log_->sent.push_back(request);
            if (log_->fail_send) {
                throw vault::TransportException("read " + config_.host + " failed: connection reset");
            }
            if (log_->responses.empty()) {
                return MakeResponse(http::status::internal_server_error, "{}");
            }
            HttpResponse response = std::move(log_->responses.front());
            log_->responses.pop_front();
            return response;
        }

        const std::string& GetHost() const override { return config_.host; }

    private:
        ChannelConfig config_;
        std::shared_ptr<ChannelLog> log_;
    };

    inline ChannelFactory MakeFakeFactory(std::shared_ptr<ChannelLog> log)
    {
        return [log](const ChannelConfig& config) -> std::unique_ptr<IHttpChannel> {
            log->built.push_back(config);
            if (log->fail_build) {
                throw vault::TransportException("handshake " + config.host + " failed");
            }
            return std::make_unique<FakeHttpChannel>(config, log);
        };
    }

} // namespace secret_env::test
