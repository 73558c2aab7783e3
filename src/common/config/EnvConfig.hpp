// src/common/config/EnvConfig.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace secret_env::config
{
    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string source_path;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // .env 파일 로드 (없으면 ConfigurationException)
        void LoadFromFile(const std::string& file_path);

        // 직접 값 설정 (테스트 및 CLI 덮어쓰기용)
        void Set(const std::string& key, const std::string& value);

        // 필수 값 (없거나 비어 있으면 ConfigurationException)
        std::string GetString(const std::string& key) const;
        uint32_t GetUInt32(const std::string& key) const;
        bool GetBool(const std::string& key) const;

        // 파일 값 -> 프로세스 환경 변수 -> 기본값 순으로 조회
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;

        // 쉼표 구분 배열, 없으면 빈 목록
        std::vector<std::string> GetStringArray(const std::string& key) const;

        // 설정값 존재 여부 확인 (파일 값만)
        bool HasKey(const std::string& key) const;

        const std::string& GetSourcePath() const { return source_path; }
        bool IsLoaded() const { return is_loaded; }
        size_t Size() const { return config_map.size(); }

        static std::vector<std::string> SplitList(const std::string& value);

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace secret_env::config
