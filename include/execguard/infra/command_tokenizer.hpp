#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execguard::infra {

/// A user-supplied command line split into executable and arguments.
struct CommandSpec {
    std::string raw_executable;
    std::vector<std::string> argv;
};

/// Splits a command line into tokens, honouring double quotes, single quotes
/// and backslash escapes.
///
/// Grammar (single pass, never fails):
///   - Spaces outside quotes separate tokens. `\ ` keeps a literal space.
///   - A quote opens a quoted region only at the start of a token; the other
///     quote kind is literal inside it. `""` produces an empty token.
///   - Inside "...", `\"` and `\\` are escapes. A backslash directly before
///     the final closing quote of the input is literal, so `"C:\Folder\"`
///     yields `C:\Folder\`.
///   - Inside '...', only `\'` and `\\` are escapes.
///   - An unterminated quoted region is flushed as the last token.
[[nodiscard]] auto tokenize(std::string_view text) -> std::vector<std::string>;

/// Tokenizes the arguments of a slash command, dropping everything up to the
/// first space (e.g. `/addproject name "path with spaces"` yields
/// `name`, `path with spaces`). Input without a space yields no arguments.
[[nodiscard]] auto parse_command_args(std::string_view text) -> std::vector<std::string>;

/// Tokenizes `text` and splits off the first token as the executable.
/// Returns nullopt when the input holds no token at all.
[[nodiscard]] auto split_command(std::string_view text) -> std::optional<CommandSpec>;

/// Wraps `arg` in double quotes when it contains whitespace or characters a
/// shell would interpret, escaping `\` and `"`. Arguments already wrapped in
/// matching quotes are returned unchanged.
[[nodiscard]] auto quote_argument_if_needed(std::string_view arg) -> std::string;

/// Joins command parts and arguments into a single display string. The first
/// part is emitted verbatim, every other part through
/// quote_argument_if_needed().
[[nodiscard]] auto build_command_display(const std::vector<std::string>& command_parts,
                                         const std::vector<std::string>& args)
    -> std::string;

} // namespace execguard::infra
