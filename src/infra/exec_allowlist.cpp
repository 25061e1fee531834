#include "execguard/infra/exec_allowlist.hpp"

#include "execguard/core/config.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"
#include "execguard/infra/dangerous_flags.hpp"
#include "execguard/infra/path_allowlist.hpp"

#include <algorithm>
#include <filesystem>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace execguard::infra {

namespace fs = std::filesystem;

namespace {

auto is_separator(char c) -> bool {
    return c == '/' || c == '\\';
}

auto is_drive_letter(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// Comparison form of an absolute executable path.
auto comparable_path(std::string_view path) -> std::string {
    return normalize_for_comparison(fs::path(std::string(path)).lexically_normal().string());
}

auto strip_display_extension(std::string_view name) -> std::string {
    auto lower = utils::to_lower(name);
    for (std::string_view ext : {".exe", ".cmd"}) {
        if (lower.size() > ext.size() && lower.ends_with(ext)) {
            return std::string(name.substr(0, name.size() - ext.size()));
        }
    }
    return std::string(name);
}

auto reject(ExecErrorKind kind, std::string rejected,
            std::vector<std::string> allowed = {}) -> ValidationVerdict {
    ValidationVerdict verdict;
    verdict.ok = false;
    verdict.error = ExecError{kind, std::move(rejected), std::move(allowed)};
    return verdict;
}

/// Pool for PATH lookups issued through async_validate().
auto blocking_pool() -> boost::asio::thread_pool& {
    static boost::asio::thread_pool pool(2);
    return pool;
}

auto run_validation(ExecutableAllowlist checker,
                    std::string command,
                    std::vector<std::string> argv)
    -> boost::asio::awaitable<ValidationVerdict> {
    co_return checker.validate(command, argv);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Metacharacter grammar
// ---------------------------------------------------------------------------

auto classify_char(char c, char next) noexcept -> MetaCharClass {
    switch (c) {
        case ';':  return MetaCharClass::CommandSeparator;
        case '|':  return MetaCharClass::Pipe;
        case '&':  return MetaCharClass::Background;
        case '`':  return MetaCharClass::Backtick;
        case '<':
        case '>':  return MetaCharClass::Redirect;
        case '\n':
        case '\r': return MetaCharClass::LineBreak;
        case '\0': return MetaCharClass::NullByte;
        case '$':  return next == '(' ? MetaCharClass::Substitution : MetaCharClass::Ordinary;
        default:   return MetaCharClass::Ordinary;
    }
}

auto meta_char_class_name(MetaCharClass cls) -> std::string_view {
    switch (cls) {
        case MetaCharClass::Ordinary: return "ordinary";
        case MetaCharClass::CommandSeparator: return "command separator ';'";
        case MetaCharClass::Pipe: return "pipe '|'";
        case MetaCharClass::Background: return "background '&'";
        case MetaCharClass::Backtick: return "backtick '`'";
        case MetaCharClass::Substitution: return "command substitution '$('";
        case MetaCharClass::Redirect: return "redirection '<' or '>'";
        case MetaCharClass::LineBreak: return "line break";
        case MetaCharClass::NullByte: return "null byte";
    }
    return "unknown";
}

auto find_shell_metacharacter(std::string_view command) -> std::optional<MetaCharMatch> {
    for (size_t i = 0; i < command.size(); ++i) {
        char next = i + 1 < command.size() ? command[i + 1] : '\0';
        auto cls = classify_char(command[i], next);
        if (cls != MetaCharClass::Ordinary) {
            return MetaCharMatch{i, cls};
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Executable forms
// ---------------------------------------------------------------------------

auto executable_basename(std::string_view command) -> std::string {
    auto pos = command.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return std::string(command);
    }
    return std::string(command.substr(pos + 1));
}

auto has_parent_segment(std::string_view command) -> bool {
    size_t start = 0;
    while (start <= command.size()) {
        auto end = command.find_first_of("/\\", start);
        auto segment = command.substr(start, end == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : end - start);
        if (segment == "..") return true;
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return false;
}

auto classify_executable(std::string_view command) -> ExecutableForm {
    std::string cmd(command);

    if (command.size() >= 2 && is_separator(command[0]) && is_separator(command[1])) {
        return UncPath{std::move(cmd)};
    }
    if (command.size() >= 3 && is_drive_letter(command[0]) && command[1] == ':' &&
        is_separator(command[2])) {
        return AbsolutePath{cmd, executable_basename(command)};
    }
    if (!command.empty() && is_separator(command[0])) {
        return AbsolutePath{cmd, executable_basename(command)};
    }
    if (command.find_first_of("/\\") != std::string_view::npos) {
        return RelativePath{std::move(cmd)};
    }
    return BareName{std::move(cmd)};
}

auto basename_matches(std::string_view basename,
                      const std::vector<std::string>& allowed) -> bool {
    if (basename.empty()) return false;
#ifdef _WIN32
    auto lower = utils::to_lower(basename);
    return std::ranges::any_of(allowed, [&](const std::string& entry) {
        return utils::to_lower(entry) == lower;
    });
#else
    return std::ranges::find(allowed, basename) != allowed.end();
#endif
}

// ---------------------------------------------------------------------------
// Verdict
// ---------------------------------------------------------------------------

auto exec_error_kind_to_string(ExecErrorKind kind) -> std::string_view {
    switch (kind) {
        case ExecErrorKind::EmptyCommand: return "empty-command";
        case ExecErrorKind::DisallowedMetacharacters: return "disallowed-metacharacters";
        case ExecErrorKind::NotInAllowlist: return "not-in-allowlist";
        case ExecErrorKind::AbsolutePathNotInSystemPath: return "absolute-path-not-in-system-path";
        case ExecErrorKind::UnsupportedPathForm: return "unsupported-path-form";
    }
    return "unknown";
}

auto allowlist_display(const std::vector<std::string>& allowed) -> std::string {
    std::vector<std::string> names;
    for (const auto& entry : allowed) {
        auto name = strip_display_extension(entry);
        if (std::ranges::find(names, name) == names.end()) {
            names.push_back(std::move(name));
        }
    }
    return utils::join(names, ", ");
}

auto ExecError::message() const -> std::string {
    switch (kind) {
        case ExecErrorKind::EmptyCommand:
            return "Command is empty";
        case ExecErrorKind::DisallowedMetacharacters:
            return "Command contains disallowed characters (" + rejected +
                   "). Shell operators such as ; & | ` $( < > are not accepted";
        case ExecErrorKind::NotInAllowlist:
            return "Executable '" + rejected + "' is not allowed. Allowed: " +
                   allowlist_display(allowed);
        case ExecErrorKind::AbsolutePathNotInSystemPath:
            return "Absolute path '" + rejected + "' is not in the system PATH. "
                   "Only absolute paths that point to system executables are allowed";
        case ExecErrorKind::UnsupportedPathForm:
            return "Executable reference '" + rejected + "' is not allowed. "
                   "Use a bare name or an absolute path without '..'";
    }
    return "Executable rejected";
}

auto ValidationVerdict::to_error() const -> Error {
    if (!error.has_value()) {
        return make_error(ErrorCode::InternalError, "Verdict carries no error");
    }
    auto code = ErrorCode::InvalidArgument;
    if (error->kind == ExecErrorKind::NotInAllowlist ||
        error->kind == ExecErrorKind::AbsolutePathNotInSystemPath) {
        code = ErrorCode::Forbidden;
    }
    return make_error(code, std::string(exec_error_kind_to_string(error->kind)),
                      error->message());
}

// ---------------------------------------------------------------------------
// ExecutableAllowlist
// ---------------------------------------------------------------------------

ExecutableAllowlist::ExecutableAllowlist(std::shared_ptr<PathResolver> resolver)
    : ExecutableAllowlist(std::move(resolver), [] { return get_allowed_executables(); }) {}

ExecutableAllowlist::ExecutableAllowlist(std::shared_ptr<PathResolver> resolver,
                                         AllowlistSource source)
    : resolver_(std::move(resolver)), source_(std::move(source)) {}

auto ExecutableAllowlist::validate(std::string_view command) const -> ValidationVerdict {
    auto trimmed = utils::trim(command);
    if (trimmed.empty()) {
        return reject(ExecErrorKind::EmptyCommand, "");
    }

    if (auto meta = find_shell_metacharacter(trimmed)) {
        LOG_WARN("Executable rejected: {} at offset {}",
                 meta_char_class_name(meta->cls), meta->position);
        return reject(ExecErrorKind::DisallowedMetacharacters,
                      std::string(meta_char_class_name(meta->cls)));
    }

    if (has_parent_segment(trimmed)) {
        LOG_WARN("Executable rejected: '..' segment in {}", trimmed);
        return reject(ExecErrorKind::UnsupportedPathForm, trimmed);
    }

    auto allowed = source_();
    auto form = classify_executable(trimmed);

    return std::visit([&](const auto& f) -> ValidationVerdict {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, BareName>) {
            return validate_bare(f, allowed);
        } else if constexpr (std::is_same_v<T, AbsolutePath>) {
            return validate_absolute(f, allowed);
        } else if constexpr (std::is_same_v<T, UncPath>) {
            LOG_WARN("Executable rejected: UNC path {}", f.path);
            return reject(ExecErrorKind::UnsupportedPathForm, f.path);
        } else {
            static_assert(std::is_same_v<T, RelativePath>);
            LOG_WARN("Executable rejected: relative path {}", f.path);
            return reject(ExecErrorKind::UnsupportedPathForm, f.path);
        }
    }, form);
}

auto ExecutableAllowlist::validate(std::string_view command,
                                   const std::vector<std::string>& argv) const
    -> ValidationVerdict {
    auto verdict = validate(command);
    if (verdict.ok) {
        verdict.dangerous_flags = detect_dangerous_flags(argv);
    }
    return verdict;
}

auto ExecutableAllowlist::async_validate(std::string command,
                                         std::vector<std::string> argv) const
    -> boost::asio::awaitable<ValidationVerdict> {
    co_return co_await boost::asio::co_spawn(
        blocking_pool().get_executor(),
        run_validation(*this, std::move(command), std::move(argv)),
        boost::asio::use_awaitable);
}

auto ExecutableAllowlist::validate_bare(const BareName& bare,
                                        const std::vector<std::string>& allowed) const
    -> ValidationVerdict {
    if (!basename_matches(bare.name, allowed)) {
        LOG_WARN("Executable rejected by allowlist: {}", bare.name);
        return reject(ExecErrorKind::NotInAllowlist, bare.name, allowed);
    }

    ValidationVerdict verdict;
    verdict.ok = true;
    verdict.basename = bare.name;

    auto located = resolver_ ? resolver_->lookup(bare.name)
                             : Result<std::vector<std::string>>(std::unexpected(
                                   make_error(ErrorCode::NotFound, "No PATH resolver")));
    if (!located) {
        LOG_DEBUG("Allowed executable '{}' not resolvable: {}", bare.name, located.error().what());
        verdict.warnings.push_back("Command '" + bare.name +
                                   "' was not found in the system PATH. Make sure it is "
                                   "installed or use a full path");
    }
    return verdict;
}

auto ExecutableAllowlist::validate_absolute(const AbsolutePath& abs,
                                            const std::vector<std::string>& allowed) const
    -> ValidationVerdict {
    if (!basename_matches(abs.basename, allowed)) {
        LOG_WARN("Executable rejected by allowlist: {} ({})", abs.basename, abs.path);
        return reject(ExecErrorKind::NotInAllowlist, abs.basename, allowed);
    }

    if (!resolver_) {
        return reject(ExecErrorKind::AbsolutePathNotInSystemPath, abs.path);
    }

    auto located = resolver_->lookup(abs.basename);
    if (!located) {
        LOG_WARN("Absolute executable {} rejected: lookup of '{}' failed ({})",
                 abs.path, abs.basename, located.error().what());
        return reject(ExecErrorKind::AbsolutePathNotInSystemPath, abs.path);
    }

    auto supplied = comparable_path(abs.path);
    auto match = std::ranges::find_if(*located, [&](const std::string& candidate) {
        return comparable_path(candidate) == supplied;
    });
    if (match == located->end()) {
        LOG_WARN("Absolute path impersonation rejected: {} is not among [{}]",
                 abs.path, utils::join(*located, ", "));
        return reject(ExecErrorKind::AbsolutePathNotInSystemPath, abs.path);
    }

    LOG_DEBUG("Absolute executable {} matches PATH entry {}", abs.path, *match);
    ValidationVerdict verdict;
    verdict.ok = true;
    verdict.basename = abs.basename;
    return verdict;
}

auto validate_executable(std::string_view command) -> ValidationVerdict {
    ExecutableAllowlist checker(
        std::shared_ptr<PathResolver>(make_system_path_resolver(path_lookup_timeout())));
    return checker.validate(command);
}

} // namespace execguard::infra
