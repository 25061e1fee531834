#include "execguard/core/config.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <mutex>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace execguard {

namespace {

std::mutex g_env_mutex;

auto has_path_separator(std::string_view s) -> bool {
    return s.find('/') != std::string_view::npos ||
           s.find('\\') != std::string_view::npos;
}

#ifdef _WIN32
constexpr std::string_view kHomeEnv = "USERPROFILE";
#else
constexpr std::string_view kHomeEnv = "HOME";
#endif

auto is_readable(const std::filesystem::path& p) -> bool {
#ifdef _WIN32
    std::error_code ec;
    auto perms = std::filesystem::status(p, ec).permissions();
    return !ec && (perms & std::filesystem::perms::owner_read) != std::filesystem::perms::none;
#else
    return ::access(p.c_str(), R_OK) == 0;
#endif
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        if (config.security.path_lookup_timeout_ms <= 0) {
            LOG_WARN("Config: path_lookup_timeout_ms must be positive, using {}",
                     kDefaultLookupTimeoutMs);
            config.security.path_lookup_timeout_ms = kDefaultLookupTimeoutMs;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto val = get_env(kLogLevelEnv)) {
        config.log_level = *val;
    }
    config.security.allowed_paths = get_allowed_paths();
    if (auto val = get_env(kAllowedExecutablesEnv); val && !utils::is_blank(*val)) {
        config.security.allowed_executables = utils::split_list(*val);
    }
    config.security.path_lookup_timeout_ms =
        static_cast<int>(path_lookup_timeout().count());

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto apply_config(const Config& config) -> VoidResult {
    if (!config.security.allowed_paths.empty()) {
        auto result = set_allowed_paths(config.security.allowed_paths);
        if (!result) return result;
    }
    if (config.security.allowed_executables.has_value()) {
        auto result = set_allowed_executables(*config.security.allowed_executables);
        if (!result) return result;
    }
    if (config.security.path_lookup_timeout_ms != kDefaultLookupTimeoutMs) {
        auto result = set_env(kLookupTimeoutEnv,
                              std::to_string(config.security.path_lookup_timeout_ms));
        if (!result) return result;
    }
    return {};
}

auto get_env(std::string_view name) -> std::optional<std::string> {
    std::lock_guard lock(g_env_mutex);
    if (auto* val = std::getenv(std::string(name).c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

auto set_env(std::string_view name, std::string_view value) -> VoidResult {
    std::lock_guard lock(g_env_mutex);
    std::string key(name);
    std::string val(value);
#ifdef _WIN32
    if (::_putenv_s(key.c_str(), val.c_str()) != 0) {
#else
    if (::setenv(key.c_str(), val.c_str(), 1) != 0) {
#endif
        return std::unexpected(make_error(ErrorCode::InternalError,
            "Failed to set environment variable", key));
    }
    return {};
}

auto get_allowed_paths() -> std::vector<std::string> {
    std::vector<std::string> paths;
    auto raw = get_env(kAllowedPathsEnv);
    if (!raw) return paths;

    for (const auto& entry : utils::split_list(*raw)) {
        paths.push_back(utils::lexical_absolute(entry).string());
    }
    return paths;
}

auto set_allowed_paths(const std::vector<std::string>& paths) -> VoidResult {
    for (const auto& p : paths) {
        if (utils::is_blank(p)) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed path entries must not be empty"));
        }
        if (p.find(',') != std::string::npos || p.find('\0') != std::string::npos) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed path contains a reserved character", p));
        }
        if (!std::filesystem::path(utils::trim(p)).is_absolute()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed path must be absolute", p));
        }
        if (is_filesystem_root(utils::trim(p))) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed path must not be a filesystem root", p));
        }
    }

    std::vector<std::string> normalized;
    normalized.reserve(paths.size());
    for (const auto& p : paths) {
        normalized.push_back(utils::lexical_absolute(utils::trim(p)).string());
    }

    auto result = set_env(kAllowedPathsEnv, utils::join(normalized, ","));
    if (result) {
        LOG_INFO("Allowed paths replaced ({} entries)", normalized.size());
    }
    return result;
}

auto is_filesystem_root(const std::filesystem::path& path) -> bool {
    auto normal = path.lexically_normal();
    return normal.has_root_directory() && normal.relative_path().empty();
}

auto validate_allowed_path(std::string_view path) -> Result<std::string> {
    auto entry = utils::trim(path);
    if (entry.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Allowed path entries must not be empty"));
    }
    if (entry.find('\0') != std::string::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Allowed path contains a null byte"));
    }

    auto resolved = utils::lexical_absolute(entry);

    if (is_filesystem_root(resolved)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Allowed path must not be a filesystem root", resolved.string()));
    }

    std::error_code ec;
    if (!std::filesystem::exists(resolved, ec)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Allowed path does not exist", resolved.string()));
    }
    if (!is_readable(resolved)) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Allowed path is not readable", resolved.string()));
    }

    if (auto home = get_env(kHomeEnv); home && !utils::is_blank(*home)) {
        if (utils::lexical_absolute(*home) == resolved) {
            LOG_WARN("Home directory configured as an allowed path: {}", resolved.string());
        }
    }

    return resolved.string();
}

auto parse_allowed_paths(std::string_view input) -> AllowedPathsCheck {
    AllowedPathsCheck check;
    for (auto& entry : utils::split_list(input)) {
        auto result = validate_allowed_path(entry);
        if (result) {
            check.valid.push_back(std::move(*result));
        } else {
            LOG_DEBUG("Allowed path rejected: {} ({})", entry, result.error().what());
            check.invalid.push_back(RejectedPath{std::move(entry), result.error()});
        }
    }
    return check;
}

auto default_allowed_executables() -> const std::vector<std::string>& {
    static const std::vector<std::string> defaults = {
        "node", "node.exe",
        "python", "python.exe",
        "python3", "python3.exe",
        "npx", "npx.cmd",
        "deno", "deno.exe",
        "bun", "bun.exe",
    };
    return defaults;
}

auto get_allowed_executables() -> std::vector<std::string> {
    auto raw = get_env(kAllowedExecutablesEnv);
    if (!raw || utils::is_blank(*raw)) {
        return default_allowed_executables();
    }
    return utils::split_list(*raw);
}

auto set_allowed_executables(const std::vector<std::string>& names) -> VoidResult {
    std::vector<std::string> cleaned;
    cleaned.reserve(names.size());
    for (const auto& name : names) {
        auto entry = utils::trim(name);
        if (entry.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed executable entries must not be empty"));
        }
        if (entry.find(',') != std::string::npos || has_path_separator(entry)) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Allowed executable must be a plain basename", entry));
        }
        cleaned.push_back(std::move(entry));
    }
    return set_env(kAllowedExecutablesEnv, utils::join(cleaned, ","));
}

auto path_lookup_timeout() -> std::chrono::milliseconds {
    auto raw = get_env(kLookupTimeoutEnv);
    if (!raw || utils::is_blank(*raw)) {
        return std::chrono::milliseconds(kDefaultLookupTimeoutMs);
    }

    auto text = utils::trim(*raw);
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value <= 0) {
        LOG_WARN("Ignoring invalid {}='{}'", kLookupTimeoutEnv, *raw);
        return std::chrono::milliseconds(kDefaultLookupTimeoutMs);
    }
    return std::chrono::milliseconds(value);
}

} // namespace execguard
