#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "execguard/core/error.hpp"

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros work
// with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace execguard {

using json = nlohmann::json;

/// Environment variables backing the process-wide allowlists.
inline constexpr std::string_view kAllowedPathsEnv = "ALLOWED_PATHS";
inline constexpr std::string_view kAllowedExecutablesEnv = "MCP_ALLOWED_EXECUTABLES";
inline constexpr std::string_view kLogLevelEnv = "EXECGUARD_LOG_LEVEL";
inline constexpr std::string_view kLookupTimeoutEnv = "EXECGUARD_PATH_LOOKUP_TIMEOUT_MS";

inline constexpr int kDefaultLookupTimeoutMs = 5000;

struct SecurityConfig {
    std::vector<std::string> allowed_paths;
    std::optional<std::vector<std::string>> allowed_executables;
    int path_lookup_timeout_ms = kDefaultLookupTimeoutMs;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SecurityConfig, allowed_paths, allowed_executables, path_lookup_timeout_ms)

struct Config {
    std::string log_level = "info";
    std::optional<std::string> env_file;
    SecurityConfig security;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, env_file, security)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Publishes the allowlists of `config` into the process-wide store.
/// Empty lists leave the current store untouched so that values coming from
/// the environment keep precedence over an unset config file.
auto apply_config(const Config& config) -> VoidResult;

// ---------------------------------------------------------------------------
// Process environment
// ---------------------------------------------------------------------------

/// Reads an environment variable. All reads and writes made through these
/// helpers are serialized, so a concurrent setter is never observed half-way.
auto get_env(std::string_view name) -> std::optional<std::string>;

/// Sets an environment variable (always overwrites).
auto set_env(std::string_view name, std::string_view value) -> VoidResult;

// ---------------------------------------------------------------------------
// Allowlist store
// ---------------------------------------------------------------------------

/// Allowed directories from ALLOWED_PATHS: comma-separated, trimmed, empty
/// entries dropped, each made absolute. Re-read on every call.
auto get_allowed_paths() -> std::vector<std::string>;

/// Replaces the allowed directories wholesale. Rejects empty entries,
/// relative paths, filesystem roots, and entries that cannot round-trip
/// through the comma-separated encoding.
auto set_allowed_paths(const std::vector<std::string>& paths) -> VoidResult;

/// True for `/`, `C:\` and anything that normalizes to a root.
auto is_filesystem_root(const std::filesystem::path& path) -> bool;

/// Checks one candidate allowlist entry before it is stored: it must exist,
/// be readable, and not be a filesystem root. The home directory is accepted
/// with a warning. Returns the absolute, normalized form of the entry.
auto validate_allowed_path(std::string_view path) -> Result<std::string>;

struct RejectedPath {
    std::string path;
    Error error;
};

struct AllowedPathsCheck {
    std::vector<std::string> valid;
    std::vector<RejectedPath> invalid;
};

/// Splits a comma-separated list and runs validate_allowed_path() on every
/// entry. Blank entries are skipped.
auto parse_allowed_paths(std::string_view input) -> AllowedPathsCheck;

/// The built-in executable allowlist used when MCP_ALLOWED_EXECUTABLES is
/// unset or blank.
auto default_allowed_executables() -> const std::vector<std::string>&;

/// Allowed executable basenames from MCP_ALLOWED_EXECUTABLES, falling back to
/// default_allowed_executables(). Re-read on every call.
auto get_allowed_executables() -> std::vector<std::string>;

auto set_allowed_executables(const std::vector<std::string>& names) -> VoidResult;

/// Upper bound for a single PATH lookup subprocess.
auto path_lookup_timeout() -> std::chrono::milliseconds;

} // namespace execguard
