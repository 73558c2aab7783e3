// src/common/network/https/src/SecureChannelBuilder.cpp
#include "common/network/https/include/SecureChannelBuilder.hpp"
#include "common/network/https/include/HttpsChannel.hpp"
#include "common/network/https/include/HttpChannel.hpp"
#include "common/network/tls/include/TlsContext.hpp"
#include "common/utils/logger/Logger.hpp"

namespace secret_env::network::https
{
    ChannelConfig SecureChannelBuilder::SecretManagerEndpoint(uint32_t timeout_ms)
    {
        ChannelConfig config;
        config.host = SECRET_MANAGER_HOST;
        config.port = DEFAULT_HTTPS_PORT;
        config.use_tls = true;
        config.timeout_ms = timeout_ms;
        return config;
    }

    std::unique_ptr<IHttpChannel> SecureChannelBuilder::Build(const ChannelConfig& config)
    {
        if (!config.use_tls) {
            LOG_DEBUGF("SecureChannelBuilder", "Opening plain HTTP channel to %s", config.host.c_str());
            return HttpChannel::Connect(config);
        }

        LOG_DEBUGF("SecureChannelBuilder", "Opening TLS channel to %s", config.host.c_str());
        return HttpsChannel::Connect(config, tls::TlsContext::CreateWithEmbeddedRoots());
    }

    ChannelFactory SecureChannelBuilder::DefaultFactory()
    {
        return [](const ChannelConfig& config) {
            return Build(config);
        };
    }

} // namespace secret_env::network::https
