// src/common/vault/include/LocalFileVault.hpp
#pragma once
#include "common/vault/include/IVault.hpp"
#include <filesystem>
#include <string>

namespace secret_env::vault
{
    /**
     * @brief 디렉토리의 <name>.json 파일을 시크릿으로 사용하는 로컬 백엔드
     *
     * 개발/테스트 환경용
     */
    class LocalFileVault : public IVault
    {
    public:
        explicit LocalFileVault(std::filesystem::path root_dir);
        ~LocalFileVault() override = default;

        EnvEntries DownloadPrefixed(const std::string& prefix) const override;

        /**
         * @throws ConfigurationException 이름에 경로 구분자 또는 ".." 포함
         * @throws RemoteCallException(NOT_FOUND) 파일 없음 또는 읽기 실패
         * @throws EmptySecretException 빈 파일
         * @throws DecodeException JSON 해석 또는 변환 실패
         */
        EnvEntries DownloadJson(const std::string& secret_name) const override;

        const char* Name() const override { return "local"; }

        const std::filesystem::path& GetRootDir() const { return root_dir_; }

    private:
        std::filesystem::path SecretPath(const std::string& secret_name) const;

        std::filesystem::path root_dir_;
    };

} // namespace secret_env::vault
