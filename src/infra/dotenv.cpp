#include "execguard/infra/dotenv.hpp"

#include "execguard/core/config.hpp"
#include "execguard/core/logger.hpp"

#include <fstream>
#include <string_view>

namespace execguard::infra::dotenv {

namespace {

auto trim_view(std::string_view s) -> std::string_view {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

auto parse_quoted_value(std::string_view rest, char quote_char) -> std::string {
    std::string value;
    for (size_t pos = 0; pos < rest.size(); ++pos) {
        char c = rest[pos];
        if (c == quote_char) {
            return value;
        }
        if (c == '\\' && quote_char == '"' && pos + 1 < rest.size()) {
            char next = rest[++pos];
            switch (next) {
                case 'n':  value += '\n'; break;
                case 'r':  value += '\r'; break;
                case 't':  value += '\t'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                default:
                    value += '\\';
                    value += next;
                    break;
            }
        } else {
            value += c;
        }
    }
    // Unterminated quote keeps what was read.
    return value;
}

auto parse_unquoted_value(std::string_view raw) -> std::string {
    auto comment_pos = raw.find(" #");
    if (comment_pos != std::string_view::npos) {
        raw = raw.substr(0, comment_pos);
    }
    return std::string(trim_view(raw));
}

} // anonymous namespace

auto parse(const std::filesystem::path& path)
    -> Result<std::unordered_map<std::string, std::string>> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Could not open .env file", path.string()));
    }

    std::unordered_map<std::string, std::string> env_map;
    std::string raw_line;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;

        auto line = trim_view(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.starts_with("export ")) {
            line = trim_view(line.substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            LOG_WARN("{}:{}: Skipping malformed line (no '=')", path.string(), line_number);
            continue;
        }

        auto key = std::string(trim_view(line.substr(0, eq_pos)));
        if (key.empty()) {
            LOG_WARN("{}:{}: Skipping line with empty key", path.string(), line_number);
            continue;
        }

        auto value_part = trim_view(line.substr(eq_pos + 1));
        if (!value_part.empty() && (value_part.front() == '"' || value_part.front() == '\'')) {
            env_map[std::move(key)] = parse_quoted_value(value_part.substr(1), value_part.front());
        } else {
            env_map[std::move(key)] = parse_unquoted_value(value_part);
        }
    }

    LOG_DEBUG("Parsed {} variables from {}", env_map.size(), path.string());
    return env_map;
}

auto load(const std::filesystem::path& path, bool overwrite) -> Result<size_t> {
    auto env_map = parse(path);
    if (!env_map) {
        return std::unexpected(env_map.error());
    }

    size_t applied = 0;
    for (const auto& [key, value] : *env_map) {
        if (!overwrite && get_env(key).has_value()) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }
        auto result = set_env(key, value);
        if (!result) {
            LOG_WARN("Failed to set env var {}: {}", key, result.error().what());
            continue;
        }
        ++applied;
    }

    LOG_INFO("Loaded {} variables from {}", applied, path.string());
    return applied;
}

} // namespace execguard::infra::dotenv
