#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "execguard/core/config.hpp"
#include "execguard/infra/command_tokenizer.hpp"
#include "execguard/mcp/env_parser.hpp"
#include "execguard/mcp/server_validation.hpp"

namespace execguard::cli {

/// A registered subcommand and the handler that runs it once global setup is
/// done. The handler returns the process exit code.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int()> run;
};

/// Register the `check-path` subcommand.
/// Prints `allowed` or `denied` for every path; exits 0 only if all pass.
auto register_check_path_command(CLI::App& app) -> Command;

/// Register the `check-exec` subcommand.
/// Validates an executable plus its arguments and prints the decision as
/// JSON. `--env` takes the server environment, whose names are echoed.
/// Exit codes: 0 accepted, 1 rejected, 2 confirmation required.
auto register_check_exec_command(CLI::App& app) -> Command;

/// Register the `validate-paths` subcommand.
/// Prints valid and invalid entries as JSON, plus the ALLOWED_PATHS line to
/// store. Exits 0 only if every entry is usable.
auto register_validate_paths_command(CLI::App& app) -> Command;

/// Register the `check-url` subcommand.
/// Applies the MCP HTTP server URL checks.
auto register_check_url_command(CLI::App& app) -> Command;

/// Register the `tokenize` subcommand.
/// Prints the tokens of its argument as a JSON array.
auto register_tokenize_command(CLI::App& app) -> Command;

/// Register the `config` subcommand.
/// Prints the effective configuration and allowlists as JSON.
auto register_config_command(CLI::App& app, const Config& config) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> Command;

// ---------------------------------------------------------------------------
// Output helpers
// ---------------------------------------------------------------------------

/// Builds the executable and arguments from `check-exec` words. A single word
/// is tokenized as a full command line; several words are taken as already
/// split by the shell.
auto parse_exec_words(const std::vector<std::string>& words)
    -> std::optional<infra::CommandSpec>;

auto decision_to_json(const mcp::RegistrationDecision& decision) -> json;

auto allowed_paths_check_to_json(const AllowedPathsCheck& check) -> json;

/// `config` plus the allowlists currently in effect.
auto effective_config_json(const Config& config) -> json;

} // namespace execguard::cli
