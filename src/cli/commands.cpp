#include "execguard/cli/commands.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"
#include "execguard/infra/exec_allowlist.hpp"
#include "execguard/infra/path_allowlist.hpp"
#include "execguard/infra/path_resolver.hpp"

#include <iostream>
#include <memory>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef EXECGUARD_VERSION_STRING
#define EXECGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace execguard::cli {

namespace {

constexpr int kExitAccepted = 0;
constexpr int kExitRejected = 1;
constexpr int kExitNeedsConfirmation = 2;

} // anonymous namespace

// ---------------------------------------------------------------------------
// Output helpers
// ---------------------------------------------------------------------------

auto parse_exec_words(const std::vector<std::string>& words)
    -> std::optional<infra::CommandSpec> {
    if (words.empty()) {
        return std::nullopt;
    }
    if (words.size() == 1) {
        return infra::split_command(words.front());
    }
    return infra::CommandSpec{words.front(), {words.begin() + 1, words.end()}};
}

auto decision_to_json(const mcp::RegistrationDecision& decision) -> json {
    json j;
    j["accepted"] = decision.accepted;
    j["requires_confirmation"] = decision.requires_confirmation;
    j["basename"] = decision.verdict.basename;
    j["dangerous_flags"] = decision.report.matched;
    j["warnings"] = decision.warnings;
    if (!decision.report.full_command.empty()) {
        j["full_command"] = decision.report.full_command;
    }
    if (decision.verdict.error) {
        j["rejection"] = std::string(infra::exec_error_kind_to_string(decision.verdict.error->kind));
    }
    if (decision.error) {
        j["error"] = decision.error->what();
    }
    return j;
}

auto allowed_paths_check_to_json(const AllowedPathsCheck& check) -> json {
    json j;
    j["valid"] = check.valid;
    j["invalid"] = json::array();
    for (const auto& rejected : check.invalid) {
        j["invalid"].push_back({
            {"path", rejected.path},
            {"code", std::string(error_code_to_string(rejected.error.code()))},
            {"error", rejected.error.what()},
        });
    }
    if (!check.valid.empty()) {
        j["env_line"] = std::string(kAllowedPathsEnv) + "=" + utils::join(check.valid, ",");
    }
    return j;
}

auto effective_config_json(const Config& config) -> json {
    json j = config;
    j["security"]["allowed_paths"] = get_allowed_paths();
    j["security"]["allowed_executables"] = get_allowed_executables();
    j["security"]["path_lookup_timeout_ms"] = path_lookup_timeout().count();
    return j;
}

// ---------------------------------------------------------------------------
// check-path command
// ---------------------------------------------------------------------------

auto register_check_path_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("check-path", "Check paths against ALLOWED_PATHS");

    auto paths = std::make_shared<std::vector<std::string>>();
    sub->add_option("paths", *paths, "Paths to check")->required();

    return {sub, [paths]() {
        auto roots = get_allowed_paths();
        if (roots.empty()) {
            LOG_WARN("No allowed paths configured; every path is denied");
        }

        bool all_allowed = true;
        for (const auto& p : *paths) {
            auto decision = infra::evaluate_path(p, roots);
            if (decision.allowed) {
                std::cout << "allowed\t" << p << "\t" << decision.resolved << "\n";
            } else {
                all_allowed = false;
                std::cout << "denied\t" << p << "\n";
            }
        }
        return all_allowed ? kExitAccepted : kExitRejected;
    }};
}

// ---------------------------------------------------------------------------
// check-exec command
// ---------------------------------------------------------------------------

auto register_check_exec_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("check-exec",
        "Validate an executable and its arguments (options before the command)");

    auto confirm = std::make_shared<bool>(false);
    sub->add_flag("--confirm-dangerous", *confirm,
                  "Accept dangerous interpreter flags such as -e or --eval");

    auto env_spec = std::make_shared<std::string>();
    sub->add_option("--env", *env_spec,
                    "Server environment as KEY=value,KEY2=\"a,b\" (- for none)");

    // Everything from the first non-option word on is the command line.
    sub->prefix_command();

    return {sub, [sub, confirm, env_spec]() {
        auto spec = parse_exec_words(sub->remaining());
        if (!spec) {
            std::cerr << "error: check-exec needs a command\n";
            return kExitRejected;
        }

        auto env = mcp::parse_env_variables(*env_spec);
        if (!env) {
            LOG_WARN("Server environment rejected: {}", env.error().what());
            json j;
            j["accepted"] = false;
            j["requires_confirmation"] = false;
            j["rejection"] = "invalid-env";
            j["error"] = env.error().what();
            std::cout << j.dump(2) << "\n";
            return kExitRejected;
        }

        infra::ExecutableAllowlist checker(
            std::shared_ptr<infra::PathResolver>(
                infra::make_system_path_resolver(path_lookup_timeout())));
        auto decision = mcp::check_stdio_server(checker, spec->raw_executable, spec->argv, *confirm);

        auto j = decision_to_json(decision);
        // Values may hold secrets; only the names are echoed.
        j["env"] = json::array();
        for (const auto& [key, value] : *env) {
            j["env"].push_back(key);
        }
        std::cout << j.dump(2) << "\n";
        if (decision.accepted) return kExitAccepted;
        return decision.requires_confirmation ? kExitNeedsConfirmation : kExitRejected;
    }};
}

// ---------------------------------------------------------------------------
// validate-paths command
// ---------------------------------------------------------------------------

auto register_validate_paths_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("validate-paths",
        "Check candidate ALLOWED_PATHS entries before storing them");

    auto entries = std::make_shared<std::vector<std::string>>();
    sub->add_option("paths", *entries, "Directories, comma-separated or as separate words")
        ->required();

    return {sub, [entries]() {
        auto check = parse_allowed_paths(utils::join(*entries, ","));
        std::cout << allowed_paths_check_to_json(check).dump(2) << "\n";
        if (check.valid.empty() || !check.invalid.empty()) {
            return kExitRejected;
        }
        return kExitAccepted;
    }};
}

// ---------------------------------------------------------------------------
// check-url command
// ---------------------------------------------------------------------------

auto register_check_url_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("check-url", "Check an MCP server URL");

    auto url = std::make_shared<std::string>();
    sub->add_option("url", *url, "http(s) URL")->required();

    return {sub, [url]() {
        auto result = mcp::check_http_server(*url);
        if (!result) {
            std::cout << "denied\t" << *url << "\t" << result.error().what() << "\n";
            return kExitRejected;
        }
        std::cout << "allowed\t" << *url << "\n";
        return kExitAccepted;
    }};
}

// ---------------------------------------------------------------------------
// tokenize command
// ---------------------------------------------------------------------------

auto register_tokenize_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("tokenize", "Split a command line into tokens");

    auto text = std::make_shared<std::string>();
    sub->add_option("text", *text, "Command line text (quote it)")->required();

    return {sub, [text]() {
        json tokens = infra::tokenize(*text);
        std::cout << tokens.dump() << "\n";
        return kExitAccepted;
    }};
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app, const Config& config) -> Command {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    return {sub, [&config]() {
        std::cout << effective_config_json(config).dump(2) << "\n";
        return kExitAccepted;
    }};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");

    return {sub, []() {
        std::cout << "execguard " << EXECGUARD_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
        return kExitAccepted;
    }};
}

} // namespace execguard::cli
