// src/common/auth/include/MetadataServerCredential.hpp
#pragma once
#include "common/auth/include/OAuthCredential.hpp"
#include <string>

namespace secret_env::auth
{
    constexpr const char* DEFAULT_METADATA_HOST = "metadata.google.internal";
    constexpr const char* METADATA_TOKEN_PATH =
        "/computeMetadata/v1/instance/service-accounts/default/token";

    /**
     * @brief GCE/GKE/Cloud Run 메타데이터 서버의 기본 서비스 계정
     *
     * 평문 HTTP, "Metadata-Flavor: Google" 헤더 필수
     * 호스트는 GCE_METADATA_HOST 환경 변수로 변경 가능
     */
    class MetadataServerCredential : public OAuthCredential
    {
    public:
        explicit MetadataServerCredential(network::https::ChannelFactory channel_factory);

        /**
         * @param host "host" 또는 "host:port"
         * @throws ConfigurationException 포트 범위 밖이거나 경로 포함
         */
        MetadataServerCredential(std::string host, network::https::ChannelFactory channel_factory);

        const char* Type() const override { return "metadata_server"; }

        const std::string& GetHost() const { return host_; }

    protected:
        AccessToken FetchToken() override;

    private:
        std::string host_;
        network::https::ChannelConfig endpoint_;
    };

} // namespace secret_env::auth
