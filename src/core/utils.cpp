#include "execguard/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace execguard::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto is_blank(std::string_view s) -> bool {
    return s.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

auto split_list(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> entries;
    for (auto& part : split(s, ',')) {
        auto entry = trim(part);
        if (!entry.empty()) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

auto lexical_absolute(const std::filesystem::path& p) -> std::filesystem::path {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) {
        abs = p;
    }
    auto normal = abs.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace execguard::utils
