#include "execguard/infra/path_allowlist.hpp"

#include "execguard/core/config.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"

#include <array>

namespace execguard::infra {

namespace fs = std::filesystem;

namespace {

auto final_component(std::string_view path) -> std::string_view {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) return path;
    return path.substr(pos + 1);
}

/// Input that is malformed before any filesystem work is attempted.
auto is_malformed_input(std::string_view candidate) -> bool {
    if (utils::is_blank(candidate)) {
        return true;
    }
    if (candidate.size() > kMaxPathLength) {
        LOG_WARN("Path rejected: length {} exceeds {}", candidate.size(), kMaxPathLength);
        return true;
    }
    if (candidate.find('\0') != std::string_view::npos) {
        LOG_WARN("Path rejected: contains a null byte");
        return true;
    }
    if (is_device_namespace_path(candidate)) {
        LOG_WARN("Path rejected: device namespace path");
        return true;
    }
#ifdef _WIN32
    if (is_reserved_device_name(candidate)) {
        LOG_WARN("Path rejected: reserved device name");
        return true;
    }
#endif
    return false;
}

} // anonymous namespace

auto canonicalize_candidate(const fs::path& path) -> fs::path {
    std::error_code ec;
    auto real = fs::canonical(path, ec);
    if (!ec) {
        return real;
    }
    // Not there yet (or unreadable): keep it checkable as a lexical path.
    return utils::lexical_absolute(path);
}

auto normalize_for_comparison(std::string_view path) -> std::string {
#ifdef _WIN32
    if (path.starts_with("\\\\?\\")) {
        path.remove_prefix(4);
    }
    return utils::to_lower(path);
#else
    return std::string(path);
#endif
}

auto is_within_root(const fs::path& candidate, const fs::path& root) -> bool {
    if (candidate == root) {
        return true;
    }

    auto relative = candidate.lexically_relative(root);
    // Empty means no lexical relation, e.g. different drives on Windows.
    if (relative.empty()) {
        return false;
    }
    if (relative == ".") {
        return true;
    }
    if (relative.is_absolute() || relative.has_root_name()) {
        return false;
    }
    return *relative.begin() != "..";
}

auto is_device_namespace_path(std::string_view path) -> bool {
    if (path.size() < 4) return false;
    auto is_sep = [](char c) { return c == '\\' || c == '/'; };
    if (!is_sep(path[0]) || !is_sep(path[1]) || !is_sep(path[3])) {
        return false;
    }
    if (path[2] == '.') {
        return true;
    }
    if (path[2] == '?') {
        return utils::to_lower(path.substr(4)).starts_with("globalroot");
    }
    return false;
}

auto is_reserved_device_name(std::string_view path) -> bool {
    static constexpr std::array<std::string_view, 6> kPlainNames = {
        "con", "prn", "aux", "nul", "conin$", "conout$",
    };

    auto name = final_component(path);
    while (!name.empty() && (name.back() == '.' || name.back() == ' ' || name.back() == ':')) {
        name.remove_suffix(1);
    }
    if (auto dot = name.find('.'); dot != std::string_view::npos) {
        name = name.substr(0, dot);
    }
    while (!name.empty() && name.back() == ' ') {
        name.remove_suffix(1);
    }

    auto lower = utils::to_lower(name);
    for (auto reserved : kPlainNames) {
        if (lower == reserved) return true;
    }
    if (lower.size() == 4 && (lower.starts_with("com") || lower.starts_with("lpt"))) {
        return lower[3] >= '1' && lower[3] <= '9';
    }
    return false;
}

auto evaluate_path(std::string_view candidate,
                   const std::vector<std::string>& allowed_roots) -> PathDecision {
    PathDecision decision;

    if (allowed_roots.empty()) {
        LOG_DEBUG("Path denied: allowlist is empty");
        return decision;
    }
    if (is_malformed_input(candidate)) {
        return decision;
    }

    auto resolved = canonicalize_candidate(fs::path(std::string(candidate)));
    auto resolved_norm = normalize_for_comparison(resolved.string());
    decision.resolved = resolved.string();

    for (const auto& root : allowed_roots) {
        if (utils::is_blank(root)) continue;

        auto root_canonical = canonicalize_candidate(fs::path(root));
        auto root_norm = normalize_for_comparison(root_canonical.string());

        if (is_within_root(fs::path(resolved_norm), fs::path(root_norm))) {
            decision.allowed = true;
            decision.matched_root = root;
            LOG_DEBUG("Path allowed: {} (root {})", decision.resolved, root);
            return decision;
        }
    }

    LOG_DEBUG("Path denied: {} is outside {} allowed root(s)",
              decision.resolved, allowed_roots.size());
    return decision;
}

auto is_path_allowed(std::string_view candidate,
                     const std::vector<std::string>& allowed_roots) -> bool {
    return evaluate_path(candidate, allowed_roots).allowed;
}

auto is_path_allowed(std::string_view candidate) -> bool {
    return is_path_allowed(candidate, get_allowed_paths());
}

} // namespace execguard::infra
