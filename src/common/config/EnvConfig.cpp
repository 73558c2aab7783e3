// src/common/config/EnvConfig.cpp
#include "EnvConfig.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace secret_env::config
{
    void EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            throw vault::ConfigurationException("failed to open env file: " + file_path);
        }
        config_map.clear();

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_no, file_path.c_str());
            }
        }
        file.close();

        source_path = file_path;
        is_loaded = true;
        LOG_DEBUGF("EnvConfig", "Loaded %zu configuration entries from %s", config_map.size(), file_path.c_str());
    }

    void EnvConfig::Set(const std::string& key, const std::string& value)
    {
        config_map[key] = value;
    }

    // ========================================
    // 필수 값 (없으면 예외)
    // ========================================

    std::string EnvConfig::GetString(const std::string& key) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            throw vault::ConfigurationException("required config missing: " + key);
        }
        return it->second;
    }

    uint32_t EnvConfig::GetUInt32(const std::string& key) const
    {
        std::string value = GetString(key);

        try {
            size_t pos = 0;
            unsigned long parsed = std::stoul(value, &pos);
            if (pos != value.size() || parsed > UINT32_MAX) {
                throw std::out_of_range("Value out of range for uint32_t");
            }
            return static_cast<uint32_t>(parsed);
        } catch (const std::exception&) {
            throw vault::ConfigurationException("invalid uint32 value for key '" + key + "': " + value);
        }
    }

    bool EnvConfig::GetBool(const std::string& key) const
    {
        std::string value = GetString(key);

        std::transform(value.begin(), value.end(), value.begin(), ::tolower);

        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        } else if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        } else {
            throw vault::ConfigurationException("invalid boolean value for key '" + key + "': " + value);
        }
    }

    // ========================================
    // 선택 값
    // ========================================

    std::string EnvConfig::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        auto it = config_map.find(key);
        if (it != config_map.end() && !it->second.empty()) {
            return it->second;
        }

        const char* env_value = std::getenv(key.c_str());
        if (env_value && *env_value) {
            return env_value;
        }

        return default_value;
    }

    std::vector<std::string> EnvConfig::GetStringArray(const std::string& key) const
    {
        return SplitList(GetStringOr(key, ""));
    }

    std::vector<std::string> EnvConfig::SplitList(const std::string& value)
    {
        std::vector<std::string> result;
        std::stringstream ss(value);
        std::string item;

        while (std::getline(ss, item, ','))
        {
            // 앞뒤 공백 제거
            size_t start = item.find_first_not_of(" \t");
            if (start != std::string::npos) {
                size_t end = item.find_last_not_of(" \t");
                item = item.substr(start, end - start + 1);
            } else {
                item.clear();
            }

            if (!item.empty()) {
                result.push_back(item);
            }
        }

        return result;
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        return config_map.find(key) != config_map.end();
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        // 앞뒤 공백 제거
        std::string trimmed = line;
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        // "export KEY=VALUE" 허용
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed.erase(0, 7);
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = trimmed.substr(0, eq_pos);
        std::string value = trimmed.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        // 따옴표로 감싼 값은 벗김
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty())
        {
            config_map[key] = value;
            return true;
        }

        return false;
    }
} // namespace secret_env::config
