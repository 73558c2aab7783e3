// src/common/auth/include/CredentialFile.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace secret_env::auth
{
    /**
     * @brief 자격 증명 JSON 파일 로드
     * @throws ConfigurationException 파일 없음, 읽기 실패, JSON 객체가 아님
     */
    nlohmann::json LoadCredentialFile(const std::filesystem::path& path);

    // 필수 문자열 필드 (없거나 비어 있으면 ConfigurationException)
    std::string RequireString(const nlohmann::json& info, const char* field);

    std::string OptionalString(const nlohmann::json& info, const char* field,
                               const std::string& default_value);

    /**
     * @brief 토큰 엔드포인트 URL 필드 (없으면 default_value)
     * @throws ConfigurationException https:// 가 아니거나 URL 형식 오류
     */
    std::string HttpsUrlField(const nlohmann::json& info, const char* field,
                              const std::string& default_value);

} // namespace secret_env::auth
