// src/common/auth/src/CredentialFile.cpp
#include "common/auth/include/CredentialFile.hpp"
#include "common/network/https/include/Url.hpp"
#include "common/vault/include/VaultException.hpp"
#include <fstream>
#include <sstream>

namespace secret_env::auth
{
    nlohmann::json LoadCredentialFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw vault::ConfigurationException("credentials file not found: " + path.string());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw vault::ConfigurationException("cannot open credentials file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        nlohmann::json info = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (info.is_discarded()) {
            throw vault::ConfigurationException("credentials file is not valid JSON: " + path.string());
        }
        if (!info.is_object()) {
            throw vault::ConfigurationException("credentials file is not a JSON object: " + path.string());
        }
        return info;
    }

    std::string RequireString(const nlohmann::json& info, const char* field)
    {
        auto it = info.find(field);
        if (it == info.end() || !it->is_string() || it->get<std::string>().empty()) {
            throw vault::ConfigurationException(std::string("credentials field missing: ") + field);
        }
        return it->get<std::string>();
    }

    std::string OptionalString(const nlohmann::json& info, const char* field,
                               const std::string& default_value)
    {
        auto it = info.find(field);
        if (it == info.end() || !it->is_string() || it->get<std::string>().empty()) {
            return default_value;
        }
        return it->get<std::string>();
    }

    std::string HttpsUrlField(const nlohmann::json& info, const char* field,
                              const std::string& default_value)
    {
        std::string url = OptionalString(info, field, default_value);
        if (!network::https::Url::Parse(url).use_tls) {
            throw vault::ConfigurationException(std::string(field) + " must use https: " + url);
        }
        return url;
    }

} // namespace secret_env::auth
