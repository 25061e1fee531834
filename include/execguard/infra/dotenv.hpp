#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

#include "execguard/core/error.hpp"

namespace execguard::infra::dotenv {

/// Parses a .env file and returns a map of key-value pairs.
/// Supports:
///   - KEY=VALUE
///   - KEY="VALUE" (double-quoted, with escape sequences)
///   - KEY='VALUE' (single-quoted, literal)
///   - # comments (full-line and inline after unquoted values)
///   - export KEY=VALUE
/// A missing or unreadable file yields NotFound.
auto parse(const std::filesystem::path& path)
    -> Result<std::unordered_map<std::string, std::string>>;

/// Parses a .env file and exports each pair into the process environment.
/// Existing variables are kept unless `overwrite` is true.
/// Returns the number of variables that were set.
auto load(const std::filesystem::path& path, bool overwrite = false) -> Result<size_t>;

} // namespace execguard::infra::dotenv
