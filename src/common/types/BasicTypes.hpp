// src/common/types/BasicTypes.hpp
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace secret_env
{
    constexpr uint16_t DEFAULT_HTTPS_PORT = 443;
    constexpr uint16_t DEFAULT_HTTP_PORT = 80;
    constexpr uint32_t DEFAULT_TIMEOUT_MS = 30000;
    constexpr uint32_t MAX_RESPONSE_SIZE = 1024 * 1024;

    /**
     * @brief 환경 변수 항목 (KEY, VALUE) 목록
     *
     * 시크릿 payload에 나타난 순서를 그대로 유지
     */
    using EnvEntries = std::vector<std::pair<std::string, std::string>>;

    enum class VaultProvider
    {
        LOCAL = 0,
        GOOGLE,
        UNKNOWN = 99
    };

    inline std::string VaultProviderToString(VaultProvider provider) {
        switch (provider) {
            case VaultProvider::LOCAL: return "local";
            case VaultProvider::GOOGLE: return "google";
            default: return "unknown";
        }
    }

    inline VaultProvider VaultProviderFromString(const std::string& str) {
        if (str == "LOCAL" || str == "local") return VaultProvider::LOCAL;
        if (str == "GOOGLE" || str == "google" || str == "gcp") return VaultProvider::GOOGLE;
        return VaultProvider::UNKNOWN;
    }
}
