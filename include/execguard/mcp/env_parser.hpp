#pragma once

#include <map>
#include <string>
#include <string_view>

#include "execguard/core/error.hpp"

namespace execguard::mcp {

/// Environment handed to a stdio MCP server, keyed by variable name.
using ServerEnv = std::map<std::string, std::string>;

/// Names follow the portable shell convention `[A-Za-z_][A-Za-z0-9_]*`.
auto is_valid_env_key(std::string_view key) -> bool;

/// Parses `KEY=value,KEY2=value2` as entered when registering a server.
///
/// Values may be wrapped in single or double quotes to carry commas, and a
/// backslash escapes the next character anywhere. Keys and unquoted values
/// are trimmed; an explicitly quoted empty value is kept. Blank input and a
/// lone `-` mean "no variables". A repeated key keeps the last value.
///
/// Fails with InvalidArgument on quotes inside a key, an empty key, a key
/// without `=`, an empty unquoted value, an unclosed quote, a trailing
/// backslash, or a key that is not a valid variable name.
auto parse_env_variables(std::string_view input) -> Result<ServerEnv>;

} // namespace execguard::mcp
