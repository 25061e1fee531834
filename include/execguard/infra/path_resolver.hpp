#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execguard/core/error.hpp"

namespace execguard::infra {

/// Looks up an executable name in the system search path.
///
/// Implementations may block (the default one spawns `which`), so callers on
/// an event loop must not invoke lookup() from the loop thread.
class PathResolver {
public:
    virtual ~PathResolver() = default;

    /// Returns every location of `name` on the search path, in search order.
    /// Errors: NotFound when the name does not resolve, Timeout when the
    /// lookup exceeded its time budget, IoError when it could not run.
    virtual auto lookup(std::string_view name) -> Result<std::vector<std::string>> = 0;
};

/// Runs `which -a <name>` in a child process and collects its output.
/// The child is killed once `timeout` elapses. POSIX only.
class SubprocessPathResolver : public PathResolver {
public:
    explicit SubprocessPathResolver(std::chrono::milliseconds timeout,
                                    std::string which_program = "which");

    auto lookup(std::string_view name) -> Result<std::vector<std::string>> override;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    std::string which_program_;
};

/// Scans the directories of a PATH string for an executable regular file.
/// On Windows every PATHEXT extension is also tried.
class EnvPathResolver : public PathResolver {
public:
    /// Uses the process PATH (and PATHEXT) at lookup time.
    EnvPathResolver() = default;

    /// Uses a fixed PATH value instead of the environment.
    explicit EnvPathResolver(std::string search_path,
                             std::optional<std::string> path_ext = std::nullopt);

    auto lookup(std::string_view name) -> Result<std::vector<std::string>> override;

private:
    std::optional<std::string> search_path_;
    std::optional<std::string> path_ext_;
};

/// The platform default: SubprocessPathResolver on POSIX, EnvPathResolver on
/// Windows.
auto make_system_path_resolver(std::chrono::milliseconds timeout)
    -> std::unique_ptr<PathResolver>;

} // namespace execguard::infra
