// src/common/vault/include/VaultConfig.hpp
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace secret_env::vault
{
    /**
     * @brief 다운로드할 시크릿 목록
     */
    struct DataConfig
    {
        std::vector<std::string> secret_names;
        std::vector<std::string> prefixes;
    };

    /**
     * @brief 백엔드 선택 및 접속 설정
     */
    struct VaultConfig
    {
        std::string provider;
        std::optional<std::filesystem::path> credentials_file;
        std::string project;
        std::filesystem::path local_dir;
        DataConfig data;
    };

} // namespace secret_env::vault
