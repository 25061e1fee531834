#include "execguard/mcp/server_validation.hpp"

#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/address_v4.hpp>

namespace execguard::mcp {

namespace net = boost::asio;

namespace {

auto is_private_ipv4(int a, int b) -> bool {
    // 10.0.0.0/8
    if (a == 10) return true;
    // 127.0.0.0/8 (loopback)
    if (a == 127) return true;
    // 0.0.0.0/8
    if (a == 0) return true;
    // 169.254.0.0/16 (link-local)
    if (a == 169 && b == 254) return true;
    // 172.16.0.0/12
    if (a == 172 && b >= 16 && b <= 31) return true;
    // 192.168.0.0/16
    if (a == 192 && b == 168) return true;
    return false;
}

auto is_digits(std::string_view s) -> bool {
    return !s.empty() && std::ranges::all_of(s, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto is_hex_digits(std::string_view s) -> bool {
    return std::ranges::all_of(s, [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto has_hex_prefix(std::string_view part) -> bool {
    return part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X');
}

/// A host whose last label is a decimal or 0x-prefixed number is an IPv4
/// address for URL purposes and never a DNS name.
auto ends_in_number(std::string_view host) -> bool {
    auto dot = host.rfind('.');
    auto last = dot == std::string_view::npos ? host : host.substr(dot + 1);
    if (is_digits(last)) return true;
    return has_hex_prefix(last) && is_hex_digits(last.substr(2));
}

/// One part of a numeric IPv4 host: decimal, octal with a leading 0, or hex
/// with a leading 0x. A bare "0x" is zero.
auto parse_ipv4_part(std::string_view part) -> std::optional<std::uint64_t> {
    if (part.empty()) return std::nullopt;

    int base = 10;
    if (has_hex_prefix(part)) {
        base = 16;
        part.remove_prefix(2);
        if (part.empty()) return 0;
    } else if (part.size() > 1 && part[0] == '0') {
        base = 8;
        part.remove_prefix(1);
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, base);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parses `host` with the IPv4 number grammar of URL hosts: one to four
/// parts, every part but the last below 256, the last filling the remaining
/// bytes. "127.1", "0x7f000001" and "0177.0.0.1" all yield 127.0.0.1.
auto parse_ipv4_host(std::string_view host) -> std::optional<net::ip::address_v4> {
    auto parts = utils::split(host, '.');
    if (parts.empty() || parts.size() > 4) return std::nullopt;

    std::vector<std::uint64_t> numbers;
    for (const auto& part : parts) {
        auto value = parse_ipv4_part(part);
        if (!value) return std::nullopt;
        numbers.push_back(*value);
    }

    std::uint64_t address = 0;
    for (size_t i = 0; i + 1 < numbers.size(); ++i) {
        if (numbers[i] > 255) return std::nullopt;
        address |= numbers[i] << (8 * (3 - i));
    }
    auto last_bytes = 5 - numbers.size();
    if (numbers.back() >= (std::uint64_t{1} << (8 * last_bytes))) {
        return std::nullopt;
    }
    address |= numbers.back();
    return net::ip::make_address_v4(static_cast<net::ip::address_v4::uint_type>(address));
}

auto is_private_ipv6(std::string_view host) -> bool {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(std::string(host), ec);
    if (ec || !addr.is_v6()) {
        LOG_WARN("Cannot parse IPv6 host '{}', treating it as private", host);
        return true;
    }

    auto v6 = addr.to_v6();
    if (v6.is_loopback() || v6.is_unspecified()) return true;

    auto bytes = v6.to_bytes();
    // fc00::/7 (unique local)
    if ((bytes[0] & 0xFE) == 0xFC) return true;
    // fe80::/10 (link-local)
    if (v6.is_link_local()) return true;
    // ::ffff:a.b.c.d
    if (v6.is_v4_mapped()) return is_private_ipv4(bytes[12], bytes[13]);
    return false;
}

auto invalid_url(std::string_view url, std::string_view reason) -> Error {
    return make_error(ErrorCode::InvalidArgument, "Invalid URL: " + std::string(reason),
                      std::string(url));
}

} // anonymous namespace

auto validate_server_name(std::string_view name) -> VoidResult {
    if (utils::is_blank(name)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Server name is empty"));
    }
    auto valid = std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
    if (!valid) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Server name may only contain letters, digits, '_' and '-'", std::string(name)));
    }
    return {};
}

auto is_local_or_private_host(std::string_view host) -> bool {
    auto h = utils::to_lower(utils::trim(host));
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }
    while (!h.empty() && h.back() == '.') {
        h.pop_back();
    }
    if (h.empty()) return true;

    if (h == "localhost" || h.ends_with(".localhost") || h.ends_with(".local")) {
        return true;
    }

    if (ends_in_number(h)) {
        auto v4 = parse_ipv4_host(h);
        if (!v4) {
            LOG_WARN("Cannot parse IPv4 host '{}', treating it as private", h);
            return true;
        }
        auto bytes = v4->to_bytes();
        return is_private_ipv4(bytes[0], bytes[1]);
    }

    if (h.find(':') != std::string::npos) {
        return is_private_ipv6(h);
    }
    return false;
}

auto parse_url(std::string_view url) -> Result<UrlParts> {
    auto trimmed = utils::trim(url);
    std::string_view rest(trimmed);

    auto scheme_end = rest.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(invalid_url(url, "missing scheme"));
    }

    UrlParts parts;
    parts.scheme = utils::to_lower(rest.substr(0, scheme_end));
    auto scheme_ok = std::isalpha(static_cast<unsigned char>(parts.scheme.front())) &&
        std::ranges::all_of(parts.scheme, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        });
    if (!scheme_ok) {
        return std::unexpected(invalid_url(url, "malformed scheme"));
    }
    rest = rest.substr(scheme_end + 3);

    // Authority ends at path, query or fragment.
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(invalid_url(url, "unterminated IPv6 literal"));
        }
        host = authority.substr(1, close - 1);
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::unexpected(invalid_url(url, "unexpected text after host"));
            }
            port = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) {
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return std::unexpected(invalid_url(url, "missing host"));
    }
    auto host_ok = std::ranges::none_of(host, [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isspace(uc) || std::iscntrl(uc) || c == '\\';
    });
    if (!host_ok) {
        return std::unexpected(invalid_url(url, "malformed host"));
    }
    if (!port.empty() && !is_digits(port)) {
        return std::unexpected(invalid_url(url, "malformed port"));
    }

    parts.host = utils::to_lower(host);
    parts.port = std::string(port);
    return parts;
}

auto validate_server_url(std::string_view url) -> VoidResult {
    if (utils::is_blank(url)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "URL is empty"));
    }

    auto parts = parse_url(url);
    if (!parts) {
        return std::unexpected(parts.error());
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "URL must use http:// or https://", parts->scheme));
    }
    if (is_local_or_private_host(parts->host)) {
        LOG_WARN("Server URL rejected, local or private host: {}", parts->host);
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "URL blocked: localhost, loopback and private networks are not allowed",
            parts->host));
    }
    return {};
}

auto check_stdio_server(const infra::ExecutableAllowlist& checker,
                        std::string_view command,
                        const std::vector<std::string>& args,
                        bool confirm_dangerous) -> RegistrationDecision {
    RegistrationDecision decision;
    auto executable = utils::trim(command);

    decision.verdict = checker.validate(executable, args);
    if (!decision.verdict.ok) {
        decision.error = decision.verdict.to_error();
        return decision;
    }

    decision.report = infra::detect_dangerous_arguments(executable, args);
    if (decision.report.dangerous()) {
        auto flags = utils::join(decision.report.matched, ", ");
        if (!confirm_dangerous) {
            LOG_WARN("Dangerous arguments in server command: {} [{}]",
                     decision.report.full_command, flags);
            decision.requires_confirmation = true;
            decision.error = make_error(ErrorCode::Forbidden,
                "Dangerous arguments detected (" + flags + "). Full command: " +
                    decision.report.full_command +
                    ". This may allow arbitrary code execution; confirm explicitly to proceed");
            return decision;
        }

        LOG_WARN("Dangerous arguments confirmed by user: {} [{}]",
                 decision.report.full_command, flags);
        decision.warnings.push_back(
            "Server added with dangerous arguments confirmed by the user: " + flags);
    }

    decision.warnings.insert(decision.warnings.end(),
                             decision.verdict.warnings.begin(),
                             decision.verdict.warnings.end());
    decision.accepted = true;
    return decision;
}

auto check_http_server(std::string_view url) -> VoidResult {
    return validate_server_url(url);
}

} // namespace execguard::mcp
