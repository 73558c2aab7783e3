// src/common/network/https/include/Url.hpp
#pragma once
#include "common/network/https/include/IHttpChannel.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace secret_env::network::https
{
    /**
     * @brief http(s)://host[:port][/path] 형태의 URL
     */
    struct Url
    {
        bool use_tls = true;
        std::string host;
        uint16_t port = DEFAULT_HTTPS_PORT;
        std::string target = "/";

        /**
         * @throws ConfigurationException 지원하지 않는 scheme 또는 잘못된 형식
         */
        static Url Parse(const std::string& url);

        ChannelConfig ToChannelConfig(uint32_t timeout_ms = DEFAULT_TIMEOUT_MS) const;
    };

    /**
     * @brief application/x-www-form-urlencoded 인코딩
     */
    std::string FormUrlEncode(std::string_view value);

} // namespace secret_env::network::https
