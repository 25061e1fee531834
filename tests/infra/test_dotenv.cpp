#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "execguard/core/config.hpp"
#include "execguard/infra/dotenv.hpp"

namespace fs = std::filesystem;
namespace dotenv = execguard::infra::dotenv;

static auto write_env_file(const std::string& content) -> fs::path {
    auto tmp = fs::temp_directory_path() / "execguard_test_dotenv.env";
    std::ofstream out(tmp);
    out << content;
    out.close();
    return tmp;
}

TEST_CASE("dotenv parse allowlist variables", "[infra][dotenv]") {
    auto path = write_env_file(
        "ALLOWED_PATHS=/srv/projects,/home/dev/work\n"
        "MCP_ALLOWED_EXECUTABLES=node,python3\n");
    auto env = dotenv::parse(path);

    REQUIRE(env.has_value());
    REQUIRE(env->size() == 2);
    CHECK(env->at("ALLOWED_PATHS") == "/srv/projects,/home/dev/work");
    CHECK(env->at("MCP_ALLOWED_EXECUTABLES") == "node,python3");

    fs::remove(path);
}

TEST_CASE("dotenv parse quoted values", "[infra][dotenv]") {
    auto path = write_env_file(
        R"(MSG="hello world")" "\n"
        R"(ESCAPED="line1\nline2")" "\n"
        R"(QUOTE="say \"hi\"")" "\n"
        "LITERAL='C:\\Tools\\node'\n");
    auto env = dotenv::parse(path);

    REQUIRE(env.has_value());
    CHECK(env->at("MSG") == "hello world");
    CHECK(env->at("ESCAPED") == "line1\nline2");
    CHECK(env->at("QUOTE") == "say \"hi\"");
    // Single-quoted values are literal.
    CHECK(env->at("LITERAL") == "C:\\Tools\\node");

    fs::remove(path);
}

TEST_CASE("dotenv parse comments, export prefix and malformed lines", "[infra][dotenv]") {
    auto path = write_env_file(
        "# allowlists\n"
        "\n"
        "export EXECGUARD_LOG_LEVEL=debug\n"
        "EXECGUARD_PATH_LOOKUP_TIMEOUT_MS=2000 # two seconds\n"
        "no_equals_sign\n"
        "=missing_key\n"
        "EMPTY=\n");
    auto env = dotenv::parse(path);

    REQUIRE(env.has_value());
    CHECK(env->size() == 3);
    CHECK(env->at("EXECGUARD_LOG_LEVEL") == "debug");
    CHECK(env->at("EXECGUARD_PATH_LOOKUP_TIMEOUT_MS") == "2000");
    CHECK(env->at("EMPTY") == "");

    fs::remove(path);
}

TEST_CASE("dotenv parse reports a missing file", "[infra][dotenv]") {
    auto env = dotenv::parse("/nonexistent/path/.env");
    REQUIRE_FALSE(env.has_value());
    CHECK(env.error().code() == execguard::ErrorCode::NotFound);
}

TEST_CASE("dotenv load respects existing variables", "[infra][dotenv]") {
    auto path = write_env_file(
        "EXECGUARD_DOTENV_TEST_A=from-file\n"
        "EXECGUARD_DOTENV_TEST_B=from-file\n");

    REQUIRE(execguard::set_env("EXECGUARD_DOTENV_TEST_A", "preset").has_value());
    REQUIRE(execguard::set_env("EXECGUARD_DOTENV_TEST_B", "").has_value());

    SECTION("without overwrite") {
        auto loaded = dotenv::load(path);
        REQUIRE(loaded.has_value());
        CHECK(*loaded == 0);
        CHECK(execguard::get_env("EXECGUARD_DOTENV_TEST_A") == "preset");
    }

    SECTION("with overwrite") {
        auto loaded = dotenv::load(path, true);
        REQUIRE(loaded.has_value());
        CHECK(*loaded == 2);
        CHECK(execguard::get_env("EXECGUARD_DOTENV_TEST_A") == "from-file");
        CHECK(execguard::get_env("EXECGUARD_DOTENV_TEST_B") == "from-file");
    }

    fs::remove(path);
}

TEST_CASE("dotenv load propagates a missing file", "[infra][dotenv]") {
    auto loaded = dotenv::load("/nonexistent/path/.env");
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code() == execguard::ErrorCode::NotFound);
}
