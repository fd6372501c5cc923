#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

using namespace cronrepo;

// ── trim / split ─────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \t\r\n") == "hello");
    REQUIRE(trim("a b") == "a b");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("split: by delimiter", "[util]") {
    REQUIRE(split("a\nb\nc", '\n') == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split("a\n\nb\n", '\n') == std::vector<std::string>{"a", "", "b"});
    REQUIRE(split("", '\n').empty());
}

TEST_CASE("split_whitespace: drops empty tokens", "[util]") {
    REQUIRE(split_whitespace("  1-10/2\t05  *  ") == std::vector<std::string>{"1-10/2", "05", "*"});
    REQUIRE(split_whitespace(" \t ").empty());
}

TEST_CASE("replace_all: every occurrence", "[util]") {
    REQUIRE(replace_all("a%b%c", "%", "\\%") == "a\\%b\\%c");
    REQUIRE(replace_all("aaa", "a", "aa") == "aaaaaa");
    REQUIRE(replace_all("abc", "", "x") == "abc");
}

// ── Expansion ────────────────────────────────────────────────────

TEST_CASE("expand_home: leading tilde only", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/logs") == std::string(home) + "/logs");
    REQUIRE(expand_home("~") == std::string(home));
    REQUIRE(expand_home("/a/~/b") == "/a/~/b");
    REQUIRE(expand_home("~user/x") == "~user/x");
}

TEST_CASE("expand_env: plain and braced variables", "[util]") {
    setenv("CRONREPO_UTIL_A", "alpha", 1);
    unsetenv("CRONREPO_UTIL_UNSET");
    REQUIRE(expand_env("$CRONREPO_UTIL_A/x") == "alpha/x");
    REQUIRE(expand_env("${CRONREPO_UTIL_A}beta") == "alphabeta");
    REQUIRE(expand_env("[$CRONREPO_UTIL_UNSET]") == "[]");
    REQUIRE(expand_env("cost $") == "cost $");
    REQUIRE(expand_env("$ 5") == "$ 5");
    REQUIRE(expand_env("${open") == "${open");
    unsetenv("CRONREPO_UTIL_A");
}

// ── shell_quote ──────────────────────────────────────────────────

TEST_CASE("shell_quote: safe words unchanged", "[util]") {
    REQUIRE(shell_quote("/srv/jobs/run.sh") == "/srv/jobs/run.sh");
    REQUIRE(shell_quote("a=b,c:d@e%f+g") == "a=b,c:d@e%f+g");
}

TEST_CASE("shell_quote: unsafe words single-quoted", "[util]") {
    REQUIRE(shell_quote("") == "''");
    REQUIRE(shell_quote("two words") == "'two words'");
    REQUIRE(shell_quote("$HOME") == "'$HOME'");
    REQUIRE(shell_quote("it's") == "'it'\"'\"'s'");
}

// ── Files ────────────────────────────────────────────────────────

TEST_CASE("atomic_write_file and read_file", "[util]") {
    auto tmpl = (std::filesystem::temp_directory_path() / "cronrepo_util_XXXXXX").string();
    REQUIRE(mkdtemp(tmpl.data()) != nullptr);
    std::string path = tmpl + "/f";

    REQUIRE(atomic_write_file(path, "one\n"));
    REQUIRE(atomic_write_file(path, "two\n"));
    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == "two\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    REQUIRE_FALSE(read_file(tmpl + "/missing", content));
    REQUIRE_FALSE(atomic_write_file(tmpl + "/no/such/dir", "x"));
    std::filesystem::remove_all(tmpl);
}

// ── Misc ─────────────────────────────────────────────────────────

TEST_CASE("short_hostname: no domain part", "[util]") {
    auto host = short_hostname();
    REQUIRE_FALSE(host.empty());
    REQUIRE(host.find('.') == std::string::npos);
}

TEST_CASE("environment_snapshot: sees the process environment", "[util]") {
    setenv("CRONREPO_UTIL_SNAP", "a=b", 1);
    auto env = environment_snapshot();
    REQUIRE(env["CRONREPO_UTIL_SNAP"] == "a=b");
    unsetenv("CRONREPO_UTIL_SNAP");
}

TEST_CASE("parse_uint: digits only", "[util]") {
    int v = -1;
    REQUIRE(parse_uint("0", v));
    REQUIRE(v == 0);
    REQUIRE(parse_uint("0042", v));
    REQUIRE(v == 42);
    REQUIRE_FALSE(parse_uint("", v));
    REQUIRE_FALSE(parse_uint("-1", v));
    REQUIRE_FALSE(parse_uint("1x", v));
    REQUIRE_FALSE(parse_uint("99999999999", v));
}
