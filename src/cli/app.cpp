#include "execguard/cli/app.hpp"
#include "execguard/cli/commands.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/infra/dotenv.hpp"

#include <filesystem>
#include <iostream>

// Version string; typically injected by CMake via -DEXECGUARD_VERSION_STRING=...
#ifndef EXECGUARD_VERSION_STRING
#define EXECGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace execguard::cli {

App::App()
    : cli_("execguard", "Path and executable allowlist checks for sandboxed agents")
{
    cli_.set_version_flag("--version", EXECGUARD_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("EXECGUARD_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname(std::string(kLogLevelEnv))
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    // Global option: .env file.
    cli_.add_option("--env-file", env_file_,
                    "Load environment variables from this .env file");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::init("execguard", log_level_.empty() ? "info" : log_level_);

    if (auto prepared = prepare(); !prepared) {
        LOG_ERROR("Startup failed: {}", prepared.error().what());
        std::cerr << "error: " << prepared.error().what() << "\n";
        return 1;
    }

    for (const auto& command : commands_) {
        if (command.sub->parsed()) {
            auto code = command.run();
            Logger::flush();
            return code;
        }
    }
    return 0;
}

auto App::prepare() -> VoidResult {
    auto file_config = default_config();
    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        file_config = load_config(std::filesystem::path(config_path_));
    }

    // --env-file wins over the config file; only an explicit one must exist.
    auto env_file = env_file_.empty() ? file_config.env_file.value_or("") : env_file_;
    if (!env_file.empty()) {
        auto loaded = infra::dotenv::load(env_file);
        if (!loaded) {
            if (!env_file_.empty()) {
                return std::unexpected(loaded.error());
            }
            LOG_WARN("Skipping env file: {}", loaded.error().what());
        } else {
            LOG_DEBUG("Loaded {} variables from {}", *loaded, env_file);
        }
    }

    if (auto applied = apply_config(file_config); !applied) {
        return applied;
    }

    config_ = load_config_from_env();
    if (!env_file.empty()) {
        config_.env_file = env_file;
    }
    config_.log_level = log_level_.empty() ? file_config.log_level : log_level_;
    Logger::set_level(config_.log_level);
    return {};
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    commands_.push_back(register_check_path_command(cli_));
    commands_.push_back(register_check_exec_command(cli_));
    commands_.push_back(register_validate_paths_command(cli_));
    commands_.push_back(register_check_url_command(cli_));
    commands_.push_back(register_tokenize_command(cli_));
    commands_.push_back(register_config_command(cli_, config_));
    commands_.push_back(register_version_command(cli_));
}

} // namespace execguard::cli
