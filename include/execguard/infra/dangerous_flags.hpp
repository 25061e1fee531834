#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace execguard::infra {

/// Interpreter flags that make the interpreter run inline code instead of a
/// file (`node -e`, `python -c`, `perl -p`, ...).
inline const std::vector<std::string> kDangerousFlags = {
    "-e", "--eval", "-c", "--code", "-p", "--print", "--interactive", "-i",
};

/// Flags matched on the confirmation prompt, plus the command line as it
/// will be shown to the user.
struct DangerousFlagReport {
    std::vector<std::string> matched;
    std::string full_command;

    [[nodiscard]] auto dangerous() const noexcept -> bool { return !matched.empty(); }
};

/// Returns the tokens of `argv` that are dangerous flags. Matching is exact
/// and case-sensitive on whole tokens; duplicates are reported once, in the
/// order first seen.
[[nodiscard]] auto detect_dangerous_flags(const std::vector<std::string>& argv)
    -> std::vector<std::string>;

/// True when `command` names an interpreter or shell that accepts packed or
/// attached short flags (node, python3.11, bash, pwsh.exe, ...).
[[nodiscard]] auto supports_dangerous_short_forms(std::string_view command) -> bool;

/// Extended scan used before registering a command.
///
/// On top of detect_dangerous_flags() it recognizes `--eval=...`,
/// `--code=...` and `--print=...`, and for interpreters and shells also
/// packed short flags (`-pe`) and attached values (`-e"code"`).
[[nodiscard]] auto detect_dangerous_arguments(const std::vector<std::string>& command_parts,
                                              const std::vector<std::string>& argv)
    -> DangerousFlagReport;

[[nodiscard]] auto detect_dangerous_arguments(std::string_view command,
                                              const std::vector<std::string>& argv)
    -> DangerousFlagReport;

} // namespace execguard::infra
