// src/cli/CliOptions.cpp
#include "CliOptions.hpp"
#include "common/utils/logger/Logger.hpp"

namespace secret_env::cli
{
    constexpr const char* DEFAULT_PROVIDER = "google";
    constexpr const char* DEFAULT_LOCAL_DIR = "secrets";

    namespace
    {
        const std::string& RequireValue(const std::vector<std::string>& args, size_t& i)
        {
            if (i + 1 >= args.size()) {
                throw UsageException("option " + args[i] + " requires a value");
            }
            return args[++i];
        }
    }

    CliOptions ParseArgs(const std::vector<std::string>& args)
    {
        CliOptions options;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else if (arg == "--env-file") {
                options.env_file = RequireValue(args, i);
            } else if (arg == "--provider") {
                options.provider = RequireValue(args, i);
            } else if (arg == "-p" || arg == "--project") {
                options.project = RequireValue(args, i);
            } else if (arg == "-c" || arg == "--credentials-file") {
                options.credentials_file = RequireValue(args, i);
            } else if (arg == "--local-dir") {
                options.local_dir = RequireValue(args, i);
            } else if (arg == "-s" || arg == "--secret") {
                options.secret_names.push_back(RequireValue(args, i));
            } else if (arg == "--prefix") {
                options.prefixes.push_back(RequireValue(args, i));
            } else if (arg == "--export") {
                options.export_format = true;
            } else if (arg == "--") {
                options.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                if (options.command.empty()) {
                    throw UsageException("'--' must be followed by a command");
                }
                break;
            } else {
                throw UsageException("unknown option: " + arg);
            }
        }

        return options;
    }

    vault::VaultConfig ResolveVaultConfig(const CliOptions& options, const config::EnvConfig& env)
    {
        vault::VaultConfig config;

        config.provider = options.provider ? *options.provider
                                           : env.GetStringOr("VAULT_PROVIDER", DEFAULT_PROVIDER);
        config.project = options.project ? *options.project
                                         : env.GetStringOr("GOOGLE_PROJECT", "");
        config.local_dir = options.local_dir ? *options.local_dir
                                             : env.GetStringOr("LOCAL_VAULT_DIR", DEFAULT_LOCAL_DIR);

        std::string credentials = options.credentials_file
            ? *options.credentials_file
            : env.GetStringOr("GOOGLE_APPLICATION_CREDENTIALS", "");
        if (!credentials.empty()) {
            config.credentials_file = credentials;
        }

        config.data.secret_names = !options.secret_names.empty()
            ? options.secret_names
            : env.GetStringArray("SECRET_NAMES");
        config.data.prefixes = !options.prefixes.empty()
            ? options.prefixes
            : env.GetStringArray("SECRET_PREFIXES");

        return config;
    }

    namespace
    {
        // 작은따옴표 안에서는 '만 '\'' 로 치환하면 됨
        std::string ShellQuote(const std::string& value)
        {
            std::string quoted;
            quoted.reserve(value.size() + 2);
            quoted.push_back('\'');
            for (char c : value) {
                if (c == '\'') {
                    quoted += "'\\''";
                } else {
                    quoted.push_back(c);
                }
            }
            quoted.push_back('\'');
            return quoted;
        }
    }

    std::string FormatEntry(const std::string& key, const std::string& value, bool export_format)
    {
        if (export_format) {
            return "export " + key + "=" + ShellQuote(value);
        }

        // 줄바꿈이 있으면 한 줄 한 항목이 깨지므로 따옴표 처리
        if (value.find_first_of("\r\n") != std::string::npos) {
            return key + "=" + ShellQuote(value);
        }
        return key + "=" + value;
    }

    void PrintUsage(const char* program_name)
    {
        LOG_INFOF("secret-env", "Usage: %s [OPTIONS] [-- COMMAND [ARGS...]]", program_name);
        LOG_INFO("secret-env", "");
        LOG_INFO("secret-env", "Options:");
        LOG_INFO("secret-env", "  --env-file FILE             Load settings from a .env file");
        LOG_INFO("secret-env", "  --provider google|local     Vault backend (default: google)");
        LOG_INFO("secret-env", "  -p, --project PROJECT       Google Cloud project");
        LOG_INFO("secret-env", "  -c, --credentials-file FILE Service account or authorized_user JSON");
        LOG_INFO("secret-env", "  --local-dir DIR             Directory for the local provider");
        LOG_INFO("secret-env", "  -s, --secret NAME           Secret to load (repeatable)");
        LOG_INFO("secret-env", "  --prefix PREFIX             Load all secrets with prefix (repeatable)");
        LOG_INFO("secret-env", "  --export                    Print as shell export statements");
        LOG_INFO("secret-env", "  -h, --help                  Show this help");
        LOG_INFO("secret-env", "");
        LOG_INFO("secret-env", "Without COMMAND the entries are printed as KEY=VALUE lines.");
        LOG_INFO("secret-env", "With COMMAND the entries are added to its environment.");
    }

} // namespace secret_env::cli
