// src/common/network/https/src/Url.cpp
#include "common/network/https/include/Url.hpp"
#include "common/vault/include/VaultException.hpp"
#include <cctype>
#include <stdexcept>

namespace secret_env::network::https
{
    Url Url::Parse(const std::string& url)
    {
        Url result;
        std::string rest;

        if (url.rfind("https://", 0) == 0) {
            result.use_tls = true;
            result.port = DEFAULT_HTTPS_PORT;
            rest = url.substr(8);
        } else if (url.rfind("http://", 0) == 0) {
            result.use_tls = false;
            result.port = DEFAULT_HTTP_PORT;
            rest = url.substr(7);
        } else {
            throw vault::ConfigurationException("unsupported URL scheme: " + url);
        }

        size_t slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos) {
            result.target = rest.substr(slash);
        }

        size_t colon = authority.find(':');
        result.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            std::string port_str = authority.substr(colon + 1);
            try {
                size_t consumed = 0;
                unsigned long parsed = std::stoul(port_str, &consumed);
                if (consumed != port_str.size() || port_str[0] == '-' ||
                    parsed == 0 || parsed > UINT16_MAX) {
                    throw std::out_of_range("Port out of range");
                }
                result.port = static_cast<uint16_t>(parsed);
            } catch (const std::exception&) {
                throw vault::ConfigurationException("invalid port in URL: " + url);
            }
        }

        if (result.host.empty()) {
            throw vault::ConfigurationException("empty host in URL: " + url);
        }

        return result;
    }

    ChannelConfig Url::ToChannelConfig(uint32_t timeout_ms) const
    {
        ChannelConfig config;
        config.host = host;
        config.port = port;
        config.use_tls = use_tls;
        config.timeout_ms = timeout_ms;
        return config;
    }

    std::string FormUrlEncode(std::string_view value)
    {
        static const char* hex = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size() * 3);

        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                encoded.push_back(static_cast<char>(c));
            } else {
                encoded.push_back('%');
                encoded.push_back(hex[c >> 4]);
                encoded.push_back(hex[c & 0x0F]);
            }
        }
        return encoded;
    }

} // namespace secret_env::network::https
