#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "execguard/core/error.hpp"
#include "execguard/infra/path_resolver.hpp"

namespace execguard::infra {

// ---------------------------------------------------------------------------
// Shell metacharacter grammar
// ---------------------------------------------------------------------------

/// Character classes of a command string. Everything but Ordinary is only
/// meaningful to a shell and is rejected.
enum class MetaCharClass {
    Ordinary,
    CommandSeparator,  // ;
    Pipe,              // |
    Background,        // &
    Backtick,          // `
    Substitution,      // $(
    Redirect,          // < >
    LineBreak,         // \n \r
    NullByte,          // \0
};

/// Classifies `c`; `next` is the following character (or '\0' at the end)
/// and is only consulted for `$(`.
[[nodiscard]] auto classify_char(char c, char next) noexcept -> MetaCharClass;

[[nodiscard]] auto meta_char_class_name(MetaCharClass cls) -> std::string_view;

struct MetaCharMatch {
    std::size_t position = 0;
    MetaCharClass cls = MetaCharClass::Ordinary;
};

/// First non-ordinary character of `command`, if any.
[[nodiscard]] auto find_shell_metacharacter(std::string_view command)
    -> std::optional<MetaCharMatch>;

// ---------------------------------------------------------------------------
// Executable reference forms
// ---------------------------------------------------------------------------

/// `node`
struct BareName {
    std::string name;
};

/// `/usr/bin/node`, `C:\Program Files\nodejs\node.exe`
struct AbsolutePath {
    std::string path;
    std::string basename;
};

/// `\\server\share\node.exe`, `//server/share/node`
struct UncPath {
    std::string path;
};

/// `bin/node`, `./node`, `..\node.exe`
struct RelativePath {
    std::string path;
};

using ExecutableForm = std::variant<BareName, AbsolutePath, UncPath, RelativePath>;

/// Classifies a trimmed executable reference. Drive-letter and UNC forms are
/// recognized on every platform.
[[nodiscard]] auto classify_executable(std::string_view command) -> ExecutableForm;

/// Final component of `command`, splitting on both `/` and `\`.
[[nodiscard]] auto executable_basename(std::string_view command) -> std::string;

/// True when any `/`- or `\`-separated segment of `command` is `..`.
[[nodiscard]] auto has_parent_segment(std::string_view command) -> bool;

/// Exact membership of `basename` in `allowed`. Case-insensitive only on
/// Windows. No prefix or substring matching.
[[nodiscard]] auto basename_matches(std::string_view basename,
                                    const std::vector<std::string>& allowed) -> bool;

// ---------------------------------------------------------------------------
// Verdict
// ---------------------------------------------------------------------------

enum class ExecErrorKind {
    EmptyCommand,
    DisallowedMetacharacters,
    NotInAllowlist,
    AbsolutePathNotInSystemPath,
    UnsupportedPathForm,
};

[[nodiscard]] auto exec_error_kind_to_string(ExecErrorKind kind) -> std::string_view;

struct ExecError {
    ExecErrorKind kind = ExecErrorKind::EmptyCommand;
    /// The rejected value: basename, path, or the offending character class.
    std::string rejected;
    /// The allowlist in effect, filled for NotInAllowlist.
    std::vector<std::string> allowed;

    /// User-facing description of the rejection.
    [[nodiscard]] auto message() const -> std::string;
};

struct ValidationVerdict {
    bool ok = false;
    std::optional<ExecError> error;
    /// Advisories that do not block the command.
    std::vector<std::string> warnings;
    /// Basename that was checked against the allowlist (empty if never reached).
    std::string basename;
    /// Dangerous flags found in the supplied arguments.
    std::vector<std::string> dangerous_flags;

    /// Dangerous flags were found; the caller must get explicit confirmation
    /// before registering the command.
    [[nodiscard]] auto requires_confirmation() const noexcept -> bool {
        return ok && !dangerous_flags.empty();
    }

    /// Maps a rejection onto Error for callers that propagate Result<T>.
    /// Must only be called when !ok.
    [[nodiscard]] auto to_error() const -> Error;
};

/// Allowed executable names for display: `.exe`/`.cmd` dropped, duplicates
/// removed, comma separated.
[[nodiscard]] auto allowlist_display(const std::vector<std::string>& allowed) -> std::string;

// ---------------------------------------------------------------------------
// Checker
// ---------------------------------------------------------------------------

/// Decides whether an executable may be spawned.
///
/// Bare names must match an allowlist entry exactly; a failed PATH lookup
/// only adds a warning. Absolute paths must have an allowlisted basename
/// and must be one of the locations the PATH lookup returns for that
/// basename, so a binary elsewhere that merely shares the name is refused.
/// UNC paths, relative paths and `..` segments are never accepted.
class ExecutableAllowlist {
public:
    using AllowlistSource = std::function<std::vector<std::string>()>;

    /// Reads the allowlist from MCP_ALLOWED_EXECUTABLES on every check.
    explicit ExecutableAllowlist(std::shared_ptr<PathResolver> resolver);

    ExecutableAllowlist(std::shared_ptr<PathResolver> resolver, AllowlistSource source);

    /// Validates an executable reference. Blocks while the PATH lookup runs.
    [[nodiscard]] auto validate(std::string_view command) const -> ValidationVerdict;

    /// Validates the executable and, when it passes, scans `argv` for
    /// dangerous flags.
    [[nodiscard]] auto validate(std::string_view command,
                                const std::vector<std::string>& argv) const
        -> ValidationVerdict;

    /// Runs validate() on a background thread and resumes the calling
    /// coroutine on its own executor once the verdict is ready.
    [[nodiscard]] auto async_validate(std::string command,
                                      std::vector<std::string> argv = {}) const
        -> boost::asio::awaitable<ValidationVerdict>;

    [[nodiscard]] auto allowed() const -> std::vector<std::string> { return source_(); }

private:
    auto validate_bare(const BareName& bare, const std::vector<std::string>& allowed) const
        -> ValidationVerdict;
    auto validate_absolute(const AbsolutePath& abs, const std::vector<std::string>& allowed) const
        -> ValidationVerdict;

    std::shared_ptr<PathResolver> resolver_;
    AllowlistSource source_;
};

/// Validates `command` with the process-wide allowlist and the platform
/// PATH resolver, bounded by path_lookup_timeout().
[[nodiscard]] auto validate_executable(std::string_view command) -> ValidationVerdict;

} // namespace execguard::infra
