// src/common/env/src/EnvDecoder.cpp
#include "common/env/include/EnvDecoder.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"

namespace secret_env::env
{
    using vault::DecodeException;

    nlohmann::ordered_json EnvDecoder::ParsePayload(const std::string& secret_name,
                                                    std::string_view payload)
    {
        try {
            return nlohmann::ordered_json::parse(payload.begin(), payload.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw DecodeException("secret '" + secret_name + "' is not valid JSON: " + e.what());
        }
    }

    EnvEntries EnvDecoder::DecodeEnvFromJson(const std::string& secret_name,
                                             const nlohmann::ordered_json& value)
    {
        if (!value.is_object()) {
            throw DecodeException("secret '" + secret_name + "' must be a JSON object, got " +
                                  std::string(value.type_name()));
        }

        EnvEntries entries;
        entries.reserve(value.size());

        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string& key = it.key();
            const auto& item = it.value();

            if (!IsValidKey(key)) {
                throw DecodeException("secret '" + secret_name + "' has invalid key '" + key + "'");
            }

            if (item.is_string()) {
                const std::string& text = item.get_ref<const std::string&>();
                // 환경 변수 값은 C 문자열이므로 NUL 이후가 잘림
                if (text.find('\0') != std::string::npos) {
                    throw DecodeException("secret '" + secret_name + "' key '" + key +
                                          "' has a value containing NUL");
                }
                entries.emplace_back(key, text);
            } else if (item.is_number() || item.is_boolean()) {
                entries.emplace_back(key, item.dump());
            } else {
                throw DecodeException("secret '" + secret_name + "' key '" + key +
                                      "' has unsupported type " + std::string(item.type_name()));
            }
        }

        LOG_DEBUGF("EnvDecoder", "Decoded %zu entries from '%s'", entries.size(), secret_name.c_str());
        return entries;
    }

    bool EnvDecoder::IsValidKey(const std::string& key)
    {
        if (key.empty()) {
            return false;
        }
        return key.find('=') == std::string::npos && key.find('\0') == std::string::npos;
    }

} // namespace secret_env::env
