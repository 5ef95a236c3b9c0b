#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <unistd.h>

using namespace pipeguard;

// ── trim / to_lower / split ──────────────────────────────────────

TEST_CASE("trim: strips leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\nhello\r\n") == "hello");
}

TEST_CASE("trim: all whitespace becomes empty", "[util]") {
    REQUIRE(trim("   \t ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("Hello WORLD 42") == "hello world 42");
}

TEST_CASE("split: splits on delimiter", "[util]") {
    auto parts = split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[2].empty());
    REQUIRE(parts[3] == "c");
}

TEST_CASE("split: empty input yields no parts", "[util]") {
    REQUIRE(split("", '\n').empty());
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars and unique", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_id();
        REQUIRE(id.size() == 16);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/.pipeguard") == std::string(home) + "/.pipeguard");
}

TEST_CASE("expand_home: leaves other paths alone", "[util]") {
    REQUIRE(expand_home("/etc/hosts") == "/etc/hosts");
    REQUIRE(expand_home("") == "");
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and writes content", "[util]") {
    auto base = std::filesystem::temp_directory_path() /
                ("pipeguard_util_" + std::to_string(getpid()));
    auto path = (base / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{\"a\":1}\n"));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "{\"a\":1}\n");

    REQUIRE(atomic_write_file(path, "replaced"));
    std::ifstream again(path);
    std::stringstream ss2;
    ss2 << again.rdbuf();
    REQUIRE(ss2.str() == "replaced");

    std::filesystem::remove_all(base);
}

// ── percent_of ───────────────────────────────────────────────────

TEST_CASE("percent_of: rounds to one decimal", "[util]") {
    REQUIRE(percent_of(1, 3) == 33.3);
    REQUIRE(percent_of(2, 3) == 66.7);
    REQUIRE(percent_of(5, 5) == 100.0);
}

TEST_CASE("percent_of: zero denominator is zero", "[util]") {
    REQUIRE(percent_of(0, 0) == 0.0);
    REQUIRE(percent_of(7, 0) == 0.0);
}
