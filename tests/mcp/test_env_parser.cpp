#include <catch2/catch_test_macros.hpp>

#include "execguard/mcp/env_parser.hpp"

#include <string>

using namespace execguard::mcp;
using execguard::ErrorCode;

TEST_CASE("parse_env_variables treats blank input as no variables", "[mcp][env_parser]") {
    for (std::string_view input : {"", "   ", "-", " - "}) {
        auto env = parse_env_variables(input);
        REQUIRE(env.has_value());
        CHECK(env->empty());
    }
}

TEST_CASE("parse_env_variables reads simple pairs", "[mcp][env_parser]") {
    auto env = parse_env_variables("API_KEY=abc123, REGION = eu-west-1 ,DEBUG=1");
    REQUIRE(env.has_value());
    CHECK(env->size() == 3);
    CHECK(env->at("API_KEY") == "abc123");
    CHECK(env->at("REGION") == "eu-west-1");
    CHECK(env->at("DEBUG") == "1");
}

TEST_CASE("parse_env_variables keeps commas inside quotes", "[mcp][env_parser]") {
    auto env = parse_env_variables(R"(HOSTS="a.example,b.example",NAMES='x,y',PLAIN=z)");
    REQUIRE(env.has_value());
    CHECK(env->at("HOSTS") == "a.example,b.example");
    CHECK(env->at("NAMES") == "x,y");
    CHECK(env->at("PLAIN") == "z");
}

TEST_CASE("parse_env_variables handles escapes and mixed quotes", "[mcp][env_parser]") {
    auto env = parse_env_variables(R"(LIST=a\,b\,c,MSG="it's fine",Q='say "hi"',EQ=a=b)");
    REQUIRE(env.has_value());
    CHECK(env->at("LIST") == "a,b,c");
    CHECK(env->at("MSG") == "it's fine");
    CHECK(env->at("Q") == R"(say "hi")");
    CHECK(env->at("EQ") == "a=b");
}

TEST_CASE("parse_env_variables accepts explicitly empty quoted values", "[mcp][env_parser]") {
    auto env = parse_env_variables(R"(EMPTY="",OTHER='',SET=1)");
    REQUIRE(env.has_value());
    CHECK(env->at("EMPTY").empty());
    CHECK(env->at("OTHER").empty());
    CHECK(env->at("SET") == "1");
}

TEST_CASE("parse_env_variables skips empty entries and keeps the last duplicate", "[mcp][env_parser]") {
    auto env = parse_env_variables("A=1,,B=2,A=3,");
    REQUIRE(env.has_value());
    CHECK(env->size() == 2);
    CHECK(env->at("A") == "3");
    CHECK(env->at("B") == "2");
}

TEST_CASE("parse_env_variables rejects malformed input", "[mcp][env_parser]") {
    for (std::string_view bad : {
             R"("KEY"=value)",      // quotes in key
             "=value",              // empty key
             "KEY",                 // no '='
             "A=1,KEY",             // no '=' in later entry
             "KEY=",                // empty unquoted value
             "KEY=  ,B=1",          // blank unquoted value
             R"(KEY="open)",        // unclosed quote
             R"(KEY='open)",
             R"(KEY=value\)",       // trailing escape
             "1KEY=value",          // invalid names
             "MY-KEY=value",
             "<b>X</b>=value",
             "KEY NAME=value",
         }) {
        auto env = parse_env_variables(bad);
        INFO(bad);
        REQUIRE_FALSE(env.has_value());
        CHECK(env.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("is_valid_env_key follows shell naming", "[mcp][env_parser]") {
    CHECK(is_valid_env_key("PATH"));
    CHECK(is_valid_env_key("_private"));
    CHECK(is_valid_env_key("node_env2"));

    CHECK_FALSE(is_valid_env_key(""));
    CHECK_FALSE(is_valid_env_key("2FA"));
    CHECK_FALSE(is_valid_env_key("MY-VAR"));
    CHECK_FALSE(is_valid_env_key("A.B"));
    CHECK_FALSE(is_valid_env_key("KEY="));
}
