#include "execguard/infra/dangerous_flags.hpp"

#include "execguard/core/utils.hpp"
#include "execguard/infra/command_tokenizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace execguard::infra {

namespace {

constexpr std::string_view kShortFlagChars = "ecpi";

constexpr std::array<std::string_view, 3> kEqualsFlags = {"--eval", "--code", "--print"};

constexpr std::array<std::string_view, 15> kInterpreterNames = {
    "node", "nodejs", "bun", "deno",
    "bash", "sh", "zsh", "ksh", "dash",
    "pwsh", "powershell", "perl", "ruby", "php", "lua",
};

void add_unique(std::vector<std::string>& out, std::string flag) {
    if (std::ranges::find(out, flag) == out.end()) {
        out.push_back(std::move(flag));
    }
}

auto is_short_flag_char(char c) -> bool {
    return kShortFlagChars.find(c) != std::string_view::npos;
}

/// python, python3, python3.12, ...
auto is_python_name(std::string_view name) -> bool {
    if (!name.starts_with("python")) return false;
    auto version = name.substr(6);
    if (version.empty()) return true;

    bool expect_digit = true;
    for (char c : version) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            expect_digit = false;
        } else if (c == '.' && !expect_digit) {
            expect_digit = true;
        } else {
            return false;
        }
    }
    return !expect_digit;
}

auto command_family_name(std::string_view command) -> std::string {
    auto slash = command.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        command = command.substr(slash + 1);
    }
    auto name = utils::to_lower(command);
    for (std::string_view ext : {".exe", ".cmd", ".bat", ".ps1"}) {
        if (name.size() > ext.size() && name.ends_with(ext)) {
            name.resize(name.size() - ext.size());
            break;
        }
    }
    return name;
}

} // anonymous namespace

auto detect_dangerous_flags(const std::vector<std::string>& argv)
    -> std::vector<std::string> {
    std::vector<std::string> matched;
    for (const auto& arg : argv) {
        if (std::ranges::find(kDangerousFlags, arg) != kDangerousFlags.end()) {
            add_unique(matched, arg);
        }
    }
    return matched;
}

auto supports_dangerous_short_forms(std::string_view command) -> bool {
    auto name = command_family_name(command);
    if (is_python_name(name)) return true;
    return std::ranges::find(kInterpreterNames, name) != kInterpreterNames.end();
}

auto detect_dangerous_arguments(const std::vector<std::string>& command_parts,
                                const std::vector<std::string>& argv)
    -> DangerousFlagReport {
    DangerousFlagReport report;
    auto primary = command_parts.empty() ? std::string_view{} : std::string_view(command_parts.front());
    bool short_forms = supports_dangerous_short_forms(primary);

    for (const auto& arg : argv) {
        if (std::ranges::find(kDangerousFlags, arg) != kDangerousFlags.end()) {
            add_unique(report.matched, arg);
            continue;
        }

        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            auto flag = std::string_view(arg).substr(0, eq);
            if (std::ranges::find(kEqualsFlags, flag) != kEqualsFlags.end()) {
                add_unique(report.matched, std::string(flag));
                continue;
            }
        }

        if (!short_forms || arg.size() < 3 || arg[0] != '-' || !is_short_flag_char(arg[1])) {
            continue;
        }

        // -pe, -iec: every packed letter is reported.
        bool packed = std::all_of(arg.begin() + 1, arg.end(), is_short_flag_char);
        if (packed) {
            for (auto it = arg.begin() + 1; it != arg.end(); ++it) {
                add_unique(report.matched, std::string{'-', *it});
            }
            continue;
        }

        // -e"code", -cscript
        add_unique(report.matched, arg.substr(0, 2));
    }

    report.full_command = build_command_display(command_parts, argv);
    return report;
}

auto detect_dangerous_arguments(std::string_view command,
                                const std::vector<std::string>& argv)
    -> DangerousFlagReport {
    return detect_dangerous_arguments(std::vector<std::string>{std::string(command)}, argv);
}

} // namespace execguard::infra
