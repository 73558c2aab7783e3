// src/common/auth/src/CredentialProvider.cpp
#include "common/auth/include/CredentialProvider.hpp"
#include "common/auth/include/AuthorizedUserCredential.hpp"
#include "common/auth/include/CredentialFile.hpp"
#include "common/auth/include/MetadataServerCredential.hpp"
#include "common/auth/include/ServiceAccountCredential.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cstdlib>

namespace secret_env::auth
{
    std::shared_ptr<ICredential> CredentialProvider::Resolve(
        const std::optional<std::filesystem::path>& credentials_file,
        network::https::ChannelFactory channel_factory)
    {
        if (credentials_file) {
            LOG_DEBUGF("CredentialProvider", "Using credentials file %s", credentials_file->c_str());
            return FromFile(*credentials_file, std::move(channel_factory));
        }

        const char* env_path = std::getenv(CREDENTIALS_ENV_VAR);
        if (env_path && *env_path) {
            LOG_DEBUGF("CredentialProvider", "Using %s=%s", CREDENTIALS_ENV_VAR, env_path);
            return FromFile(env_path, std::move(channel_factory));
        }

        const char* home = std::getenv("HOME");
        if (home && *home) {
            std::filesystem::path well_known = std::filesystem::path(home) / WELL_KNOWN_CREDENTIALS_FILE;
            std::error_code ec;
            if (std::filesystem::is_regular_file(well_known, ec)) {
                LOG_DEBUGF("CredentialProvider", "Using %s", well_known.c_str());
                return FromFile(well_known, std::move(channel_factory));
            }
        }

        LOG_DEBUG("CredentialProvider", "No credentials file found, falling back to metadata server");
        return std::make_shared<MetadataServerCredential>(std::move(channel_factory));
    }

    std::shared_ptr<ICredential> CredentialProvider::FromFile(const std::filesystem::path& path,
                                                              network::https::ChannelFactory channel_factory)
    {
        return FromJson(LoadCredentialFile(path), std::move(channel_factory));
    }

    std::shared_ptr<ICredential> CredentialProvider::FromJson(const nlohmann::json& info,
                                                              network::https::ChannelFactory channel_factory)
    {
        if (!info.is_object()) {
            throw vault::ConfigurationException("credentials must be a JSON object");
        }

        std::string type = RequireString(info, "type");

        if (type == "service_account") {
            return std::make_shared<ServiceAccountCredential>(info, std::move(channel_factory));
        }
        if (type == "authorized_user") {
            return std::make_shared<AuthorizedUserCredential>(info, std::move(channel_factory));
        }

        throw vault::ConfigurationException("unsupported credentials type: " + type);
    }

} // namespace secret_env::auth
