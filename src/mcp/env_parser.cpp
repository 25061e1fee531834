#include "execguard/mcp/env_parser.hpp"

#include "execguard/core/logger.hpp"
#include "execguard/core/utils.hpp"

#include <cctype>
#include <optional>

namespace execguard::mcp {

namespace {

auto invalid_env(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::InvalidArgument, std::move(message), std::move(detail));
}

/// Accumulates one KEY=value entry while the parser walks the input.
struct EnvEntry {
    std::string key;
    std::string value;
    bool in_key = true;
    bool value_quoted = false;

    void append(char c) {
        if (in_key) {
            key += c;
        } else {
            value += c;
        }
    }

    void reset() {
        key.clear();
        value.clear();
        in_key = true;
        value_quoted = false;
    }
};

/// Moves a finished entry into `env`. Entries with a blank key are skipped.
auto commit(EnvEntry& entry, ServerEnv& env) -> VoidResult {
    auto key = utils::trim(entry.key);
    if (key.empty()) {
        return {};
    }
    if (entry.in_key) {
        return std::unexpected(invalid_env("Missing value for environment variable", key));
    }
    auto value = utils::trim(entry.value);
    if (value.empty() && !entry.value_quoted) {
        return std::unexpected(invalid_env("Empty value for environment variable", key));
    }
    if (!is_valid_env_key(key)) {
        return std::unexpected(invalid_env(
            "Invalid environment variable name (use letters, digits and '_')", key));
    }
    env[key] = std::move(value);
    return {};
}

} // anonymous namespace

auto is_valid_env_key(std::string_view key) -> bool {
    if (key.empty()) return false;
    auto first = static_cast<unsigned char>(key.front());
    if (!std::isalpha(first) && key.front() != '_') return false;
    for (char c : key) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') return false;
    }
    return true;
}

auto parse_env_variables(std::string_view input) -> Result<ServerEnv> {
    auto text = utils::trim(input);
    ServerEnv env;
    if (text.empty() || text == "-") {
        return env;
    }

    EnvEntry entry;
    std::optional<char> quote;
    bool escaped = false;

    for (char c : text) {
        if (escaped) {
            entry.append(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }

        if (c == '"' || c == '\'') {
            if (!quote) {
                if (entry.in_key) {
                    return std::unexpected(invalid_env("Quotes are not allowed in keys"));
                }
                quote = c;
                entry.value_quoted = true;
            } else if (*quote == c) {
                quote.reset();
            } else {
                entry.append(c);
            }
            continue;
        }

        if (quote) {
            entry.append(c);
            continue;
        }

        if (c == '=' && entry.in_key) {
            if (utils::is_blank(entry.key)) {
                return std::unexpected(invalid_env("Empty key before '='"));
            }
            entry.in_key = false;
            continue;
        }

        if (c == ',') {
            if (auto ok = commit(entry, env); !ok) {
                return std::unexpected(ok.error());
            }
            entry.reset();
            continue;
        }

        entry.append(c);
    }

    if (quote) {
        return std::unexpected(invalid_env("Unclosed quote", std::string(1, *quote)));
    }
    if (escaped) {
        return std::unexpected(invalid_env("Escape character at end of input"));
    }
    if (auto ok = commit(entry, env); !ok) {
        return std::unexpected(ok.error());
    }

    LOG_DEBUG("Parsed {} server environment variables", env.size());
    return env;
}

} // namespace execguard::mcp
