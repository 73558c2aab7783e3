// src/cli/main.cpp
#include "CliOptions.hpp"
#include "common/config/EnvConfig.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/vault/include/VaultFactory.hpp"
#include "common/utils/logger/Logger.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

using namespace secret_env;
using namespace secret_env::cli;
using namespace secret_env::vault;

namespace
{
    EnvEntries DownloadAll(const IVault& vault, const DataConfig& data)
    {
        EnvEntries entries;

        for (const std::string& prefix : data.prefixes) {
            EnvEntries found = vault.DownloadPrefixed(prefix);
            entries.insert(entries.end(), found.begin(), found.end());
        }

        for (const std::string& name : data.secret_names) {
            EnvEntries found = vault.DownloadJson(name);
            entries.insert(entries.end(), found.begin(), found.end());
        }

        return entries;
    }

    int ExecWithEntries(const std::vector<std::string>& command, const EnvEntries& entries)
    {
        for (const auto& [key, value] : entries) {
            if (setenv(key.c_str(), value.c_str(), 1) != 0) {
                LOG_ERRORF("secret-env", "setenv(%s) failed: %s", key.c_str(), std::strerror(errno));
                return 1;
            }
        }

        std::vector<char*> argv;
        argv.reserve(command.size() + 1);
        for (const std::string& arg : command) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());

        // execvp는 실패했을 때만 반환
        LOG_ERRORF("secret-env", "Failed to execute %s: %s", command[0].c_str(), std::strerror(errno));
        return 1;
    }
}

int main(int argc, char* argv[])
{
    CliOptions options;
    try {
        options = ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageException& e) {
        utils::Logger::Instance().Initialize();
        LOG_ERRORF("secret-env", "%s", e.what());
        PrintUsage(argv[0]);
        return 2;
    }

    if (options.show_help) {
        utils::Logger::Instance().Initialize();
        PrintUsage(argv[0]);
        return 0;
    }

    try {
        config::EnvConfig env;
        if (options.env_file) {
            env.LoadFromFile(*options.env_file);
        }

        std::string log_level = env.GetStringOr("LOG_LEVEL", "");
        utils::Logger::Instance().Initialize(nullptr, true, log_level.empty() ? nullptr : log_level.c_str());

        ConfiguredVault configured = VaultFactory::FromConfig(ResolveVaultConfig(options, env));
        if (configured.data.secret_names.empty() && configured.data.prefixes.empty()) {
            LOG_ERROR("secret-env", "No secrets requested (use -s/--secret or SECRET_NAMES)");
            PrintUsage(argv[0]);
            return 2;
        }

        EnvEntries entries = DownloadAll(*configured.vault, configured.data);
        LOG_DEBUGF("secret-env", "Loaded %zu entries via %s vault", entries.size(), configured.vault->Name());

        if (!options.command.empty()) {
            return ExecWithEntries(options.command, entries);
        }

        for (const auto& [key, value] : entries) {
            std::cout << FormatEntry(key, value, options.export_format) << '\n';
        }
        std::cout.flush();
        return 0;

    } catch (const VaultException& e) {
        LOG_ERRORF("secret-env", "[%s] %s", VaultErrorKindToString(e.Kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERRORF("secret-env", "%s", e.what());
        return 1;
    }
}
