#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "execguard/cli/commands.hpp"
#include "execguard/core/config.hpp"

namespace execguard::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, then loads the configuration
/// file and the .env file, publishes the allowlists, and finally runs the
/// selected subcommand.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Access the effective configuration.
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Loads config and .env, applies allowlists and the log level.
    auto prepare() -> VoidResult;

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    std::string env_file_;
    std::vector<Command> commands_;
};

} // namespace execguard::cli
