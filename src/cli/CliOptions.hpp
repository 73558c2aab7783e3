// src/cli/CliOptions.hpp
#pragma once
#include "common/config/EnvConfig.hpp"
#include "common/vault/include/VaultConfig.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace secret_env::cli
{
    // 잘못된 명령행 인자 (종료 코드 2)
    class UsageException : public std::runtime_error {
    public:
        explicit UsageException(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    struct CliOptions
    {
        std::optional<std::string> env_file;
        std::optional<std::string> provider;
        std::optional<std::string> project;
        std::optional<std::string> credentials_file;
        std::optional<std::string> local_dir;
        std::vector<std::string> secret_names;
        std::vector<std::string> prefixes;
        bool export_format = false;
        bool show_help = false;

        // "--" 뒤의 실행할 명령
        std::vector<std::string> command;
    };

    /**
     * @param args argv[1..]
     * @throws UsageException 알 수 없는 옵션 또는 값 누락
     */
    CliOptions ParseArgs(const std::vector<std::string>& args);

    /**
     * @brief 명령행 > .env 파일 > 프로세스 환경 변수 순으로 VaultConfig 구성
     */
    vault::VaultConfig ResolveVaultConfig(const CliOptions& options, const config::EnvConfig& env);

    /**
     * @brief KEY=VALUE 또는 export KEY='VALUE' 한 줄
     *
     * 값에 줄바꿈이 있으면 평문 형식도 KEY='VALUE' 로 출력
     */
    std::string FormatEntry(const std::string& key, const std::string& value, bool export_format);

    void PrintUsage(const char* program_name);

} // namespace secret_env::cli
