#include "execguard/infra/command_tokenizer.hpp"

namespace execguard::infra {

namespace {

enum class TokenizerState {
    Normal,
    InDoubleQuote,
    InSingleQuote,
    Escape,
};

auto is_whitespace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto needs_quoting(char c) -> bool {
    if (is_whitespace(c)) return true;
    switch (c) {
        case ';': case '|': case '&': case '<': case '>':
        case '(': case ')': case '$': case '`': case '\\':
        case '!': case '*': case '?': case '[': case ']':
        case '{': case '}': case '\'': case '"': case '~':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

auto tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;
    auto state = TokenizerState::Normal;
    auto resume_state = TokenizerState::Normal;
    bool quoted = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        switch (state) {
            case TokenizerState::Normal:
                if (c == '\\' && i + 1 < text.size() && text[i + 1] == ' ') {
                    resume_state = state;
                    state = TokenizerState::Escape;
                } else if (c == '"' && current.empty()) {
                    quoted = true;
                    state = TokenizerState::InDoubleQuote;
                } else if (c == '\'' && current.empty()) {
                    quoted = true;
                    state = TokenizerState::InSingleQuote;
                } else if (c == ' ') {
                    if (!current.empty() || quoted) {
                        tokens.push_back(std::move(current));
                        current.clear();
                        quoted = false;
                    }
                } else {
                    current += c;
                }
                break;

            case TokenizerState::InDoubleQuote:
                if (c == '\\' && i + 1 < text.size()) {
                    char next = text[i + 1];
                    if (next == '"' && i + 2 == text.size()) {
                        // Trailing backslash of a Windows path: keep it and
                        // consume the closing quote.
                        current += c;
                        ++i;
                        state = TokenizerState::Normal;
                    } else if (next == '"' || next == '\\') {
                        resume_state = state;
                        state = TokenizerState::Escape;
                    } else {
                        current += c;
                    }
                } else if (c == '"') {
                    state = TokenizerState::Normal;
                } else {
                    current += c;
                }
                break;

            case TokenizerState::InSingleQuote:
                if (c == '\\' && i + 1 < text.size() &&
                    (text[i + 1] == '\'' || text[i + 1] == '\\')) {
                    resume_state = state;
                    state = TokenizerState::Escape;
                } else if (c == '\'') {
                    state = TokenizerState::Normal;
                } else {
                    current += c;
                }
                break;

            case TokenizerState::Escape:
                current += c;
                state = resume_state;
                break;
        }
    }

    if (!current.empty() || quoted ||
        state == TokenizerState::InDoubleQuote ||
        state == TokenizerState::InSingleQuote) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}

auto parse_command_args(std::string_view text) -> std::vector<std::string> {
    auto first_space = text.find(' ');
    if (first_space == std::string_view::npos) {
        return {};
    }
    return tokenize(text.substr(first_space + 1));
}

auto split_command(std::string_view text) -> std::optional<CommandSpec> {
    auto tokens = tokenize(text);
    if (tokens.empty()) {
        return std::nullopt;
    }

    CommandSpec spec;
    spec.raw_executable = std::move(tokens.front());
    spec.argv.assign(std::make_move_iterator(tokens.begin() + 1),
                     std::make_move_iterator(tokens.end()));
    return spec;
}

auto quote_argument_if_needed(std::string_view arg) -> std::string {
    if (arg.size() >= 2 &&
        ((arg.front() == '"' && arg.back() == '"') ||
         (arg.front() == '\'' && arg.back() == '\''))) {
        return std::string(arg);
    }

    bool needs = false;
    for (char c : arg) {
        if (needs_quoting(c)) {
            needs = true;
            break;
        }
    }
    if (!needs) {
        return std::string(arg);
    }

    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '"';
    for (char c : arg) {
        if (c == '\\' || c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

auto build_command_display(const std::vector<std::string>& command_parts,
                           const std::vector<std::string>& args) -> std::string {
    std::string display;
    bool first = true;

    auto append = [&](const std::string& part) {
        if (first) {
            display += part;
            first = false;
            return;
        }
        display += ' ';
        display += quote_argument_if_needed(part);
    };

    for (const auto& part : command_parts) append(part);
    for (const auto& arg : args) append(arg);
    return display;
}

} // namespace execguard::infra
