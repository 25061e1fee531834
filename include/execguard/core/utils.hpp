#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace execguard::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto is_blank(std::string_view s) -> bool;

/// Splits a comma-separated list, trimming each entry and dropping empty ones.
auto split_list(std::string_view s) -> std::vector<std::string>;

/// Makes `p` absolute against the working directory and normalizes it
/// lexically (no symlink resolution). A trailing separator is dropped unless
/// the result is a filesystem root.
auto lexical_absolute(const std::filesystem::path& p) -> std::filesystem::path;

} // namespace execguard::utils
