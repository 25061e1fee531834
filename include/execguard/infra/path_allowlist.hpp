#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace execguard::infra {

/// Longest path string the checker will look at. Longer input is rejected
/// before any filesystem call.
inline constexpr std::size_t kMaxPathLength = 32767;

/// Result of a containment check. `resolved` is the canonical form of the
/// candidate that was compared, `matched_root` the allowlist entry that
/// admitted it (empty when denied).
struct PathDecision {
    bool allowed = false;
    std::string resolved;
    std::string matched_root;
};

/// Checks `candidate` against the process-wide allowlist (ALLOWED_PATHS).
/// The allowlist is read fresh on every call. An empty allowlist denies
/// everything.
[[nodiscard]] auto is_path_allowed(std::string_view candidate) -> bool;

/// Same as is_path_allowed() against an explicit list of roots.
[[nodiscard]] auto is_path_allowed(std::string_view candidate,
                                   const std::vector<std::string>& allowed_roots) -> bool;

/// Full decision against an explicit list of roots.
///
/// The candidate is resolved through symlinks when it exists and made
/// absolute lexically when it does not, then compared against every root by
/// lexical relative path (never by string prefix), so `..` traversal,
/// symlink escapes and sibling directories sharing a prefix are all denied.
[[nodiscard]] auto evaluate_path(std::string_view candidate,
                                 const std::vector<std::string>& allowed_roots)
    -> PathDecision;

/// Resolves symlinks when the path exists; otherwise returns its lexical
/// absolute form.
[[nodiscard]] auto canonicalize_candidate(const std::filesystem::path& path)
    -> std::filesystem::path;

/// Applies the platform comparison form: on Windows the `\\?\` prefix is
/// stripped and the path lower-cased; elsewhere the path is unchanged.
[[nodiscard]] auto normalize_for_comparison(std::string_view path) -> std::string;

/// True when `candidate` equals `root` or lies beneath it. Both arguments
/// must already be canonical and normalized.
[[nodiscard]] auto is_within_root(const std::filesystem::path& candidate,
                                  const std::filesystem::path& root) -> bool;

/// True for Windows device namespace paths (`\\.\PhysicalDrive0`,
/// `//./pipe/x`, `\\?\GLOBALROOT\...`).
[[nodiscard]] auto is_device_namespace_path(std::string_view path) -> bool;

/// True when the final component is a reserved DOS device name (CON, PRN,
/// AUX, NUL, COM1-COM9, LPT1-LPT9, CONIN$, CONOUT$), with or without an
/// extension, ignoring case and trailing dots or spaces.
[[nodiscard]] auto is_reserved_device_name(std::string_view path) -> bool;

} // namespace execguard::infra
