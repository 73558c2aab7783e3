// src/common/vault/src/VaultFactory.cpp
#include "common/vault/include/VaultFactory.hpp"
#include "common/vault/include/GoogleSecretVault.hpp"
#include "common/vault/include/LocalFileVault.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace secret_env::vault
{
    std::unique_ptr<IVault> VaultFactory::Create(const VaultConfig& config)
    {
        std::string name = config.provider;
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        switch (VaultProviderFromString(name)) {
            case VaultProvider::GOOGLE:
                if (config.project.empty()) {
                    throw ConfigurationException("google provider requires a project");
                }
                LOG_INFOF("VaultFactory", "Using Google Secret Manager (project %s)", config.project.c_str());
                return std::make_unique<GoogleSecretVault>(config.project, config.credentials_file);

            case VaultProvider::LOCAL:
                if (config.local_dir.empty()) {
                    throw ConfigurationException("local provider requires a directory");
                }
                LOG_INFOF("VaultFactory", "Using local vault at %s", config.local_dir.c_str());
                return std::make_unique<LocalFileVault>(config.local_dir);

            default:
                throw ConfigurationException("unknown vault provider: '" + config.provider + "'");
        }
    }

    ConfiguredVault VaultFactory::FromConfig(VaultConfig config)
    {
        ConfiguredVault result;
        result.vault = Create(config);
        result.data = std::move(config.data);
        return result;
    }

} // namespace secret_env::vault
