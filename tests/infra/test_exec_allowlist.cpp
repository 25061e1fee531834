#include <catch2/catch_test_macros.hpp>

#include "execguard/core/config.hpp"
#include "execguard/infra/exec_allowlist.hpp"
#include "execguard/infra/path_resolver.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

using namespace execguard::infra;
using execguard::ErrorCode;
using Names = std::vector<std::string>;

namespace {

/// PATH lookup backed by a fixed table.
class FakePathResolver : public PathResolver {
public:
    std::map<std::string, std::vector<std::string>> table;
    std::optional<ErrorCode> failure;
    int calls = 0;

    auto lookup(std::string_view name) -> execguard::Result<std::vector<std::string>> override {
        ++calls;
        if (failure) {
            return std::unexpected(execguard::make_error(*failure, "lookup failed"));
        }
        auto it = table.find(std::string(name));
        if (it == table.end()) {
            return std::unexpected(execguard::make_error(ErrorCode::NotFound,
                "Executable not found in system PATH", std::string(name)));
        }
        return it->second;
    }
};

auto make_checker(std::shared_ptr<FakePathResolver> resolver,
                  Names allowed = execguard::default_allowed_executables())
    -> ExecutableAllowlist {
    return ExecutableAllowlist(std::move(resolver), [allowed] { return allowed; });
}

auto fake_with_node() -> std::shared_ptr<FakePathResolver> {
    auto fake = std::make_shared<FakePathResolver>();
    fake->table["node"] = {"/usr/local/bin/node", "/usr/bin/node"};
    fake->table["python3"] = {"/usr/bin/python3"};
    return fake;
}

auto error_kind(const ValidationVerdict& verdict) -> std::optional<ExecErrorKind> {
    if (!verdict.error) return std::nullopt;
    return verdict.error->kind;
}

// Helper to run a coroutine synchronously.
template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    T result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(coro);
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Metacharacter grammar
// ---------------------------------------------------------------------------

TEST_CASE("classify_char recognizes every shell metacharacter", "[infra][exec_allowlist]") {
    CHECK(classify_char(';', '\0') == MetaCharClass::CommandSeparator);
    CHECK(classify_char('|', '|') == MetaCharClass::Pipe);
    CHECK(classify_char('&', '\0') == MetaCharClass::Background);
    CHECK(classify_char('`', 'x') == MetaCharClass::Backtick);
    CHECK(classify_char('$', '(') == MetaCharClass::Substitution);
    CHECK(classify_char('<', '\0') == MetaCharClass::Redirect);
    CHECK(classify_char('>', '>') == MetaCharClass::Redirect);
    CHECK(classify_char('\n', '\0') == MetaCharClass::LineBreak);
    CHECK(classify_char('\r', '\n') == MetaCharClass::LineBreak);
    CHECK(classify_char('\0', '\0') == MetaCharClass::NullByte);

    CHECK(classify_char('$', 'H') == MetaCharClass::Ordinary);
    CHECK(classify_char('(', '\0') == MetaCharClass::Ordinary);
    CHECK(classify_char('a', '\0') == MetaCharClass::Ordinary);
    CHECK(classify_char(' ', '\0') == MetaCharClass::Ordinary);
}

TEST_CASE("find_shell_metacharacter reports the first offender", "[infra][exec_allowlist]") {
    auto match = find_shell_metacharacter("node; rm -rf / | cat");
    REQUIRE(match.has_value());
    CHECK(match->position == 4);
    CHECK(match->cls == MetaCharClass::CommandSeparator);

    auto subst = find_shell_metacharacter("node$(id)");
    REQUIRE(subst.has_value());
    CHECK(subst->cls == MetaCharClass::Substitution);

    CHECK_FALSE(find_shell_metacharacter("C:\\Program Files\\nodejs\\node.exe").has_value());
    CHECK_FALSE(find_shell_metacharacter("$HOME").has_value());
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

TEST_CASE("classify_executable produces one form per reference", "[infra][exec_allowlist]") {
    CHECK(std::holds_alternative<BareName>(classify_executable("node")));
    CHECK(std::holds_alternative<BareName>(classify_executable("node.exe")));

    auto posix = classify_executable("/usr/bin/node");
    REQUIRE(std::holds_alternative<AbsolutePath>(posix));
    CHECK(std::get<AbsolutePath>(posix).basename == "node");

    auto windows = classify_executable(R"(C:\Program Files\nodejs\node.exe)");
    REQUIRE(std::holds_alternative<AbsolutePath>(windows));
    CHECK(std::get<AbsolutePath>(windows).basename == "node.exe");
    CHECK(std::holds_alternative<AbsolutePath>(classify_executable("d:/tools/bun.exe")));

    CHECK(std::holds_alternative<UncPath>(classify_executable(R"(\\server\share\node.exe)")));
    CHECK(std::holds_alternative<UncPath>(classify_executable("//server/share/node")));

    CHECK(std::holds_alternative<RelativePath>(classify_executable("bin/node")));
    CHECK(std::holds_alternative<RelativePath>(classify_executable("./node")));
    CHECK(std::holds_alternative<RelativePath>(classify_executable("C:node.exe\\x")));
}

TEST_CASE("has_parent_segment only matches whole segments", "[infra][exec_allowlist]") {
    CHECK(has_parent_segment(".."));
    CHECK(has_parent_segment("/usr/bin/../bin/node"));
    CHECK(has_parent_segment(R"(C:\tools\..\node.exe)"));
    CHECK(has_parent_segment("../node"));
    CHECK_FALSE(has_parent_segment("/opt/node..js/node"));
    CHECK_FALSE(has_parent_segment("/usr/bin/node"));
    CHECK_FALSE(has_parent_segment("..."));
}

TEST_CASE("basename_matches is exact", "[infra][exec_allowlist]") {
    const auto& defaults = execguard::default_allowed_executables();
    CHECK(basename_matches("node", defaults));
    CHECK(basename_matches("npx.cmd", defaults));
    CHECK_FALSE(basename_matches("nodejs", defaults));
    CHECK_FALSE(basename_matches("node.evil.exe", defaults));
    CHECK_FALSE(basename_matches("nod", defaults));
    CHECK_FALSE(basename_matches("", defaults));
#ifdef _WIN32
    CHECK(basename_matches("NODE.EXE", defaults));
#else
    CHECK_FALSE(basename_matches("NODE", defaults));
#endif
}

// ---------------------------------------------------------------------------
// validate: rejections before classification
// ---------------------------------------------------------------------------

TEST_CASE("empty commands are rejected", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    for (std::string_view command : {"", "   ", "\t\n"}) {
        auto verdict = checker.validate(command);
        CHECK_FALSE(verdict.ok);
        CHECK(error_kind(verdict) == ExecErrorKind::EmptyCommand);
    }
    CHECK(fake->calls == 0);
}

TEST_CASE("shell metacharacters are rejected", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    for (std::string_view command : {"node;id", "node|cat", "node&", "node`id`", "node$(id)",
                                     "node<in", "node>out", "node\nid", "node\rid"}) {
        auto verdict = checker.validate(command);
        CHECK_FALSE(verdict.ok);
        CHECK(error_kind(verdict) == ExecErrorKind::DisallowedMetacharacters);
    }

    auto with_null = checker.validate(std::string_view("node\0x", 6));
    CHECK(error_kind(with_null) == ExecErrorKind::DisallowedMetacharacters);
    CHECK(fake->calls == 0);
}

TEST_CASE("surrounding whitespace is ignored", "[infra][exec_allowlist]") {
    auto checker = make_checker(fake_with_node());
    auto verdict = checker.validate("  node \n");
    CHECK(verdict.ok);
    CHECK(verdict.basename == "node");
}

// ---------------------------------------------------------------------------
// validate: bare names
// ---------------------------------------------------------------------------

TEST_CASE("bare names must be allowlisted exactly", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    auto ok = checker.validate("node");
    CHECK(ok.ok);
    CHECK(ok.warnings.empty());
    CHECK_FALSE(ok.error.has_value());

    for (std::string_view command : {"nodejs", "node.evil.exe", "bash", "nod"}) {
        auto verdict = checker.validate(command);
        CHECK_FALSE(verdict.ok);
        REQUIRE(error_kind(verdict) == ExecErrorKind::NotInAllowlist);
        CHECK(verdict.error->rejected == command);
        CHECK(verdict.error->allowed == execguard::default_allowed_executables());
    }
}

TEST_CASE("not-in-allowlist message lists the allowed names", "[infra][exec_allowlist]") {
    auto checker = make_checker(fake_with_node());
    auto verdict = checker.validate("bash");

    REQUIRE(verdict.error.has_value());
    CHECK(verdict.error->message() ==
          "Executable 'bash' is not allowed. Allowed: node, python, python3, npx, deno, bun");
}

TEST_CASE("bare name missing from PATH passes with a warning", "[infra][exec_allowlist]") {
    auto fake = std::make_shared<FakePathResolver>();
    auto checker = make_checker(fake);

    auto verdict = checker.validate("deno");
    CHECK(verdict.ok);
    REQUIRE(verdict.warnings.size() == 1);
    CHECK(verdict.warnings.front().find("deno") != std::string::npos);
    CHECK(fake->calls == 1);
}

TEST_CASE("bare name lookup timeout is also only a warning", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    fake->failure = ErrorCode::Timeout;
    auto checker = make_checker(fake);

    auto verdict = checker.validate("node");
    CHECK(verdict.ok);
    CHECK(verdict.warnings.size() == 1);
}

TEST_CASE("allowlist is read on every validation", "[infra][exec_allowlist]") {
    auto allowed = std::make_shared<Names>(Names{"node"});
    ExecutableAllowlist checker(fake_with_node(), [allowed] { return *allowed; });

    CHECK(checker.validate("node").ok);
    CHECK_FALSE(checker.validate("python3").ok);

    *allowed = {"python3"};
    CHECK_FALSE(checker.validate("node").ok);
    CHECK(checker.validate("python3").ok);
    CHECK(checker.allowed() == Names{"python3"});
}

// ---------------------------------------------------------------------------
// validate: absolute paths
// ---------------------------------------------------------------------------

TEST_CASE("absolute path must be a PATH location of its basename", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    SECTION("genuine location") {
        auto verdict = checker.validate("/usr/bin/node");
        CHECK(verdict.ok);
        CHECK(verdict.basename == "node");
        CHECK(verdict.warnings.empty());
        CHECK(checker.validate("/usr/local/bin/node").ok);
    }

    SECTION("lexically equivalent spelling") {
        CHECK(checker.validate("/usr/bin/./node").ok);
        CHECK(checker.validate("/usr//bin/node").ok);
    }

    SECTION("impersonation elsewhere on disk") {
        auto verdict = checker.validate("/tmp/attacker/node");
        CHECK_FALSE(verdict.ok);
        REQUIRE(error_kind(verdict) == ExecErrorKind::AbsolutePathNotInSystemPath);
        CHECK(verdict.error->rejected == "/tmp/attacker/node");
    }

    SECTION("prefix of a genuine location") {
        CHECK_FALSE(checker.validate("/usr/bin/node/node").ok);
        CHECK_FALSE(checker.validate("/usr/bin").ok);
    }
}

TEST_CASE("absolute path with a foreign basename never reaches the lookup", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    auto verdict = checker.validate("/usr/bin/bash");
    REQUIRE(error_kind(verdict) == ExecErrorKind::NotInAllowlist);
    CHECK(verdict.error->rejected == "bash");
    CHECK(fake->calls == 0);

    CHECK(error_kind(checker.validate("/opt/node.evil.exe")) == ExecErrorKind::NotInAllowlist);
}

TEST_CASE("absolute path fails closed when the lookup fails", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    SECTION("not found") {
        auto verdict = checker.validate("/usr/bin/python");
        CHECK(error_kind(verdict) == ExecErrorKind::AbsolutePathNotInSystemPath);
    }

    SECTION("timeout") {
        fake->failure = ErrorCode::Timeout;
        auto verdict = checker.validate("/usr/bin/node");
        CHECK(error_kind(verdict) == ExecErrorKind::AbsolutePathNotInSystemPath);
    }

    SECTION("no resolver at all") {
        ExecutableAllowlist bare(nullptr, [] { return Names{"node"}; });
        CHECK(error_kind(bare.validate("/usr/bin/node")) == ExecErrorKind::AbsolutePathNotInSystemPath);
        auto named = bare.validate("node");
        CHECK(named.ok);
        CHECK(named.warnings.size() == 1);
    }
}

TEST_CASE("drive-letter paths are compared against the lookup", "[infra][exec_allowlist]") {
    auto fake = std::make_shared<FakePathResolver>();
    fake->table["node.exe"] = {R"(C:\Program Files\nodejs\node.exe)"};
    auto checker = make_checker(fake);

    CHECK(checker.validate(R"(C:\Program Files\nodejs\node.exe)").ok);
    CHECK(error_kind(checker.validate(R"(D:\Temp\node.exe)")) ==
          ExecErrorKind::AbsolutePathNotInSystemPath);
}

// ---------------------------------------------------------------------------
// validate: forms that are never accepted
// ---------------------------------------------------------------------------

TEST_CASE("UNC, relative and parent-segment references are rejected", "[infra][exec_allowlist]") {
    auto fake = fake_with_node();
    auto checker = make_checker(fake);

    for (std::string_view command : {R"(\\server\share\node.exe)", "//server/share/node",
                                     "bin/node", "./node", "../node",
                                     "/usr/bin/../bin/node", R"(C:\tools\..\node.exe)"}) {
        auto verdict = checker.validate(command);
        CHECK_FALSE(verdict.ok);
        CHECK(error_kind(verdict) == ExecErrorKind::UnsupportedPathForm);
    }
    CHECK(fake->calls == 0);
}

// ---------------------------------------------------------------------------
// Dangerous flags, errors, async
// ---------------------------------------------------------------------------

TEST_CASE("validate with argv reports dangerous flags without failing", "[infra][exec_allowlist]") {
    auto checker = make_checker(fake_with_node());

    auto verdict = checker.validate("node", {"-e", "console.log(1)"});
    CHECK(verdict.ok);
    CHECK(verdict.dangerous_flags == Names{"-e"});
    CHECK(verdict.requires_confirmation());

    auto safe = checker.validate("node", {"server.js", "--port", "3000"});
    CHECK(safe.ok);
    CHECK_FALSE(safe.requires_confirmation());

    auto rejected = checker.validate("bash", {"-c", "id"});
    CHECK_FALSE(rejected.ok);
    CHECK(rejected.dangerous_flags.empty());
    CHECK_FALSE(rejected.requires_confirmation());
}

TEST_CASE("to_error maps rejections onto error codes", "[infra][exec_allowlist]") {
    auto checker = make_checker(fake_with_node());

    auto forbidden = checker.validate("bash").to_error();
    CHECK(forbidden.code() == ErrorCode::Forbidden);
    CHECK(forbidden.message() == "not-in-allowlist");
    CHECK(forbidden.detail().find("bash") != std::string_view::npos);

    CHECK(checker.validate("/tmp/attacker/node").to_error().code() == ErrorCode::Forbidden);
    CHECK(checker.validate("").to_error().code() == ErrorCode::InvalidArgument);
    CHECK(checker.validate("node;id").to_error().code() == ErrorCode::InvalidArgument);
    CHECK(checker.validate("./node").to_error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("exec_error_kind_to_string names every kind", "[infra][exec_allowlist]") {
    CHECK(exec_error_kind_to_string(ExecErrorKind::EmptyCommand) == "empty-command");
    CHECK(exec_error_kind_to_string(ExecErrorKind::DisallowedMetacharacters) == "disallowed-metacharacters");
    CHECK(exec_error_kind_to_string(ExecErrorKind::NotInAllowlist) == "not-in-allowlist");
    CHECK(exec_error_kind_to_string(ExecErrorKind::AbsolutePathNotInSystemPath) ==
          "absolute-path-not-in-system-path");
    CHECK(exec_error_kind_to_string(ExecErrorKind::UnsupportedPathForm) == "unsupported-path-form");
}

TEST_CASE("allowlist_display drops extensions and duplicates", "[infra][exec_allowlist]") {
    CHECK(allowlist_display(execguard::default_allowed_executables()) ==
          "node, python, python3, npx, deno, bun");
    CHECK(allowlist_display({"uvx", "uvx.exe", "tool.sh"}) == "uvx, tool.sh");
    CHECK(allowlist_display({}).empty());
}

TEST_CASE("async_validate resumes with the same verdict", "[infra][exec_allowlist]") {
    auto checker = make_checker(fake_with_node());

    auto ok = run_sync(checker.async_validate("/usr/bin/node", {"--print", "1"}));
    CHECK(ok.ok);
    CHECK(ok.dangerous_flags == Names{"--print"});

    auto rejected = run_sync(checker.async_validate("/tmp/attacker/node"));
    CHECK(error_kind(rejected) == ExecErrorKind::AbsolutePathNotInSystemPath);
}

// ---------------------------------------------------------------------------
// Process-wide entry point
// ---------------------------------------------------------------------------

#ifndef _WIN32
TEST_CASE("validate_executable uses the environment and the real PATH", "[infra][exec_allowlist]") {
    auto saved = execguard::get_env(execguard::kAllowedExecutablesEnv);
    REQUIRE(execguard::set_allowed_executables({"sh"}).has_value());

    SubprocessPathResolver resolver(std::chrono::milliseconds(5000));
    auto locations = resolver.lookup("sh");
    REQUIRE(locations.has_value());

    CHECK(validate_executable("sh").ok);
    CHECK(validate_executable(locations->front()).ok);
    CHECK(error_kind(validate_executable("/nonexistent/attacker/sh")) ==
          ExecErrorKind::AbsolutePathNotInSystemPath);
    CHECK(error_kind(validate_executable("node")) == ExecErrorKind::NotInAllowlist);

    (void)execguard::set_env(execguard::kAllowedExecutablesEnv, saved.value_or(""));
}
#endif
