#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "execguard/core/utils.hpp"

namespace fs = std::filesystem;

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(execguard::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(execguard::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("all whitespace") {
        REQUIRE(execguard::utils::trim(" \t\n ").empty());
    }
}

TEST_CASE("split and join", "[utils]") {
    SECTION("split keeps empty middle fields") {
        auto parts = execguard::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1].empty());
    }

    SECTION("split of empty string") {
        CHECK(execguard::utils::split("", ',').empty());
    }

    SECTION("join inserts separator between parts") {
        CHECK(execguard::utils::join({"node", "python3", "bun"}, ", ") == "node, python3, bun");
        CHECK(execguard::utils::join({}, ",").empty());
    }
}

TEST_CASE("to_lower and is_blank", "[utils]") {
    CHECK(execguard::utils::to_lower("Node.EXE") == "node.exe");
    CHECK(execguard::utils::is_blank(""));
    CHECK(execguard::utils::is_blank("  \t"));
    CHECK_FALSE(execguard::utils::is_blank(" x "));
}

TEST_CASE("split_list trims and drops empty entries", "[utils]") {
    auto entries = execguard::utils::split_list(" /srv/a , ,/srv/b,, ");
    REQUIRE(entries.size() == 2);
    CHECK(entries[0] == "/srv/a");
    CHECK(entries[1] == "/srv/b");

    CHECK(execguard::utils::split_list("").empty());
    CHECK(execguard::utils::split_list(" , ").empty());
}

TEST_CASE("lexical_absolute normalizes without touching the filesystem", "[utils]") {
#ifndef _WIN32
    SECTION("dot segments are collapsed") {
        CHECK(execguard::utils::lexical_absolute("/srv/projects/../other/./x").string() == "/srv/other/x");
    }

    SECTION("trailing separator is dropped") {
        CHECK(execguard::utils::lexical_absolute("/srv/projects/").string() == "/srv/projects");
    }

    SECTION("root stays a root") {
        CHECK(execguard::utils::lexical_absolute("/").string() == "/");
    }
#endif

    SECTION("relative paths are anchored at the working directory") {
        auto result = execguard::utils::lexical_absolute("some/dir");
        CHECK(result.is_absolute());
        CHECK(result == (fs::current_path() / "some" / "dir").lexically_normal());
    }
}
