#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execguard/core/error.hpp"
#include "execguard/infra/dangerous_flags.hpp"
#include "execguard/infra/exec_allowlist.hpp"

namespace execguard::mcp {

/// Server names are non-empty and limited to `[A-Za-z0-9_-]`.
auto validate_server_name(std::string_view name) -> VoidResult;

/// True for hosts an MCP client must never be pointed at: localhost and
/// `.local` names, loopback, unspecified, RFC 1918, link-local and IPv6
/// unique-local addresses. Numeric hosts are read with the URL IPv4 grammar
/// (decimal, octal, hex, one to four parts), so "127.1" and "2130706433" are
/// loopback. Empty hosts and malformed addresses count as local.
auto is_local_or_private_host(std::string_view host) -> bool;

/// Components of an http(s) URL needed for the registration checks.
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
};

/// Splits `url` into scheme, host and port. IPv6 literals lose their
/// brackets; the host is lower-cased. Userinfo, path, query and fragment are
/// dropped.
auto parse_url(std::string_view url) -> Result<UrlParts>;

/// Accepts only http and https URLs whose host is public.
/// InvalidArgument for malformed URLs and other schemes, Forbidden for
/// local or private hosts.
auto validate_server_url(std::string_view url) -> VoidResult;

/// Outcome of checking a stdio server definition before it is stored.
struct RegistrationDecision {
    bool accepted = false;
    /// Dangerous arguments were found and the caller has not confirmed them.
    bool requires_confirmation = false;
    infra::ValidationVerdict verdict;
    infra::DangerousFlagReport report;
    std::vector<std::string> warnings;
    std::optional<Error> error;
};

/// Validates the executable of a stdio server and scans its arguments.
///
/// A rejected executable is final. Dangerous arguments block the server until
/// `confirm_dangerous` is set, after which it is accepted with a warning.
auto check_stdio_server(const infra::ExecutableAllowlist& checker,
                        std::string_view command,
                        const std::vector<std::string>& args,
                        bool confirm_dangerous) -> RegistrationDecision;

auto check_http_server(std::string_view url) -> VoidResult;

} // namespace execguard::mcp
