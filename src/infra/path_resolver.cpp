#include "execguard/infra/path_resolver.hpp"

#include "execguard/core/config.hpp"
#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <thread>

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace execguard::infra {

namespace fs = std::filesystem;

namespace {

/// Cap on collected `which` output.
constexpr size_t kMaxLookupOutput = 64 * 1024;

auto validate_lookup_name(std::string_view name) -> VoidResult {
    if (name.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Empty executable name"));
    }
    if (name.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Executable name contains a null byte"));
    }
    // Would be read as an option by which/where.
    if (name.front() == '-') {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Executable name starts with '-'", std::string(name)));
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Executable name must not contain path separators", std::string(name)));
    }
    return {};
}

auto parse_lookup_output(std::string_view output) -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (auto& line : utils::split(output, '\n')) {
        auto entry = utils::trim(line);
        if (entry.empty()) continue;
        if (std::ranges::find(paths, entry) == paths.end()) {
            paths.push_back(std::move(entry));
        }
    }
    return paths;
}

#ifndef _WIN32

using Clock = std::chrono::steady_clock;

auto remaining_ms(Clock::time_point deadline) -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/// Reaps `pid`, killing it if it is still alive at `deadline`.
/// Returns the wait status, or nullopt if the child had to be killed.
auto reap_child(pid_t pid, Clock::time_point deadline) -> std::optional<int> {
    int status = 0;
    while (true) {
        auto rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return status;
        }
        if (rc < 0 && errno != EINTR) {
            return std::nullopt;
        }
        if (Clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

#endif

} // anonymous namespace

// ---------------------------------------------------------------------------
// SubprocessPathResolver
// ---------------------------------------------------------------------------

SubprocessPathResolver::SubprocessPathResolver(std::chrono::milliseconds timeout,
                                               std::string which_program)
    : timeout_(timeout), which_program_(std::move(which_program)) {}

auto SubprocessPathResolver::lookup(std::string_view name)
    -> Result<std::vector<std::string>> {
    if (auto valid = validate_lookup_name(name); !valid) {
        return std::unexpected(valid.error());
    }

#ifdef _WIN32
    return std::unexpected(make_error(ErrorCode::InternalError,
        "Subprocess PATH lookup is not supported on this platform"));
#else
    std::string name_str(name);
    auto deadline = Clock::now() + timeout_;

    std::array<int, 2> fds{};
    // Close-on-exec so children forked concurrently elsewhere in the process
    // never hold this lookup's pipe open.
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to create pipe for PATH lookup", std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to fork PATH lookup", std::strerror(err)));
    }

    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null, then exec which.
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execlp(which_program_.c_str(), which_program_.c_str(), "-a",
                 name_str.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::close(fds[1]);
    int read_fd = fds[0];
    ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    std::string output;
    std::array<char, 4096> buffer{};
    bool timed_out = false;

    while (true) {
        auto wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{read_fd, POLLIN, 0};
        auto rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            timed_out = true;
            break;
        }

        auto n = ::read(read_fd, buffer.data(), buffer.size());
        if (n > 0) {
            if (output.size() < kMaxLookupOutput) {
                output.append(buffer.data(), static_cast<size_t>(n));
            }
            continue;
        }
        if (n == 0) {
            break;  // EOF
        }
        if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }
    ::close(read_fd);

    if (timed_out) {
        ::kill(pid, SIGKILL);
        reap_child(pid, Clock::now());
        LOG_WARN("PATH lookup for '{}' timed out after {}ms", name_str, timeout_.count());
        return std::unexpected(make_error(ErrorCode::Timeout,
            "PATH lookup timed out", name_str));
    }

    auto status = reap_child(pid, deadline);
    if (!status.has_value()) {
        LOG_WARN("PATH lookup for '{}' did not exit in time", name_str);
        return std::unexpected(make_error(ErrorCode::Timeout,
            "PATH lookup timed out", name_str));
    }
    if (!WIFEXITED(*status)) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "PATH lookup terminated abnormally", name_str));
    }
    if (WEXITSTATUS(*status) == 127) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "PATH lookup program could not be executed", which_program_));
    }

    auto paths = parse_lookup_output(output);
    if (WEXITSTATUS(*status) != 0 || paths.empty()) {
        LOG_DEBUG("PATH lookup: '{}' not found (exit {})", name_str, WEXITSTATUS(*status));
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Executable not found in system PATH", name_str));
    }

    LOG_DEBUG("PATH lookup: '{}' -> {}", name_str, utils::join(paths, ", "));
    return paths;
#endif
}

// ---------------------------------------------------------------------------
// EnvPathResolver
// ---------------------------------------------------------------------------

EnvPathResolver::EnvPathResolver(std::string search_path,
                                 std::optional<std::string> path_ext)
    : search_path_(std::move(search_path)), path_ext_(std::move(path_ext)) {}

auto EnvPathResolver::lookup(std::string_view name) -> Result<std::vector<std::string>> {
    if (auto valid = validate_lookup_name(name); !valid) {
        return std::unexpected(valid.error());
    }

    auto search_path = search_path_ ? search_path_ : get_env("PATH");
    if (!search_path || search_path->empty()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "PATH is empty", std::string(name)));
    }

#ifdef _WIN32
    constexpr char kListSeparator = ';';
    auto ext_source = path_ext_ ? path_ext_ : get_env("PATHEXT");
    std::vector<std::string> extensions{""};
    if (!fs::path(std::string(name)).has_extension()) {
        for (auto& ext : utils::split(ext_source.value_or(".COM;.EXE;.BAT;.CMD"), ';')) {
            if (!ext.empty()) extensions.push_back(ext);
        }
    }
#else
    constexpr char kListSeparator = ':';
    std::vector<std::string> extensions{""};
    if (path_ext_) {
        for (auto& ext : utils::split(*path_ext_, ';')) {
            if (!ext.empty()) extensions.push_back(ext);
        }
    }
#endif

    std::vector<std::string> found;
    for (const auto& dir : utils::split(*search_path, kListSeparator)) {
        if (dir.empty()) continue;
        for (const auto& ext : extensions) {
            auto candidate = fs::path(dir) / (std::string(name) + ext);
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec) || ec) continue;
#ifndef _WIN32
            if (::access(candidate.c_str(), X_OK) != 0) continue;
#endif
            auto entry = candidate.string();
            if (std::ranges::find(found, entry) == found.end()) {
                found.push_back(std::move(entry));
            }
        }
    }

    if (found.empty()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Executable not found in system PATH", std::string(name)));
    }
    return found;
}

auto make_system_path_resolver(std::chrono::milliseconds timeout)
    -> std::unique_ptr<PathResolver> {
#ifdef _WIN32
    (void)timeout;
    return std::make_unique<EnvPathResolver>();
#else
    return std::make_unique<SubprocessPathResolver>(timeout);
#endif
}

} // namespace execguard::infra
