// src/common/vault/include/VaultFactory.hpp
#pragma once
#include "common/vault/include/IVault.hpp"
#include "common/vault/include/VaultConfig.hpp"
#include <memory>

namespace secret_env::vault
{
    struct ConfiguredVault
    {
        std::unique_ptr<IVault> vault;
        DataConfig data;
    };

    /**
     * @brief 설정에서 Vault 구현체 생성
     */
    class VaultFactory
    {
    public:
        /**
         * @brief provider 이름에 맞는 구현체 생성 (대소문자 무시, 앞뒤 공백 제거)
         * @throws ConfigurationException 알 수 없는 provider, google인데 project 없음,
         *         local인데 local_dir 없음
         */
        static std::unique_ptr<IVault> Create(const VaultConfig& config);

        /**
         * @brief 설정을 소비해 (Vault, DataConfig) 반환
         */
        static ConfiguredVault FromConfig(VaultConfig config);

    private:
        VaultFactory() = delete;
    };

} // namespace secret_env::vault
