#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace agentmem;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim(" a b ") == "a b");
}

// ── case conversion ──────────────────────────────────────────────

TEST_CASE("to_lower / to_upper: ASCII only", "[util]") {
    REQUIRE(to_lower("Core_Only") == "core_only");
    REQUIRE(to_upper("style_correction") == "STYLE_CORRECTION");
    REQUIRE(to_upper("").empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.agentmem/memory.db");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/.agentmem/memory.db").size());
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and leaves no temp file", "[util]") {
    std::string dir = "/tmp/agentmem_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/out.json";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("epoch_seconds: plausible wall clock", "[util]") {
    // 2020-01-01
    REQUIRE(epoch_seconds() > 1577836800ULL);
}
