// src/common/auth/src/MetadataServerCredential.cpp
#include "common/auth/include/MetadataServerCredential.hpp"
#include "common/network/https/include/Url.hpp"
#include "common/vault/include/VaultException.hpp"
#include <cstdlib>

namespace secret_env::auth
{
    using namespace network::https;

    namespace
    {
        std::string MetadataHostFromEnv()
        {
            const char* host = std::getenv("GCE_METADATA_HOST");
            if (host && *host) {
                return host;
            }
            return DEFAULT_METADATA_HOST;
        }
    }

    MetadataServerCredential::MetadataServerCredential(ChannelFactory channel_factory)
        : MetadataServerCredential(MetadataHostFromEnv(), std::move(channel_factory))
    {
    }

    MetadataServerCredential::MetadataServerCredential(std::string host, ChannelFactory channel_factory)
        : OAuthCredential(std::move(channel_factory))
        , host_(std::move(host))
    {
        // GCE_METADATA_HOST는 "host:port" 형태일 수 있음
        Url url = Url::Parse("http://" + host_);
        if (url.target != "/") {
            throw vault::ConfigurationException("invalid metadata server host: " + host_);
        }
        endpoint_ = url.ToChannelConfig();
    }

    AccessToken MetadataServerCredential::FetchToken()
    {
        HttpRequest request{http::verb::get, METADATA_TOKEN_PATH, 11};
        request.set("Metadata-Flavor", "Google");

        return Exchange(endpoint_, std::move(request));
    }

} // namespace secret_env::auth
