#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace toolbelt;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
    REQUIRE(trim("").empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: normal delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("split: empty parts preserved", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: empty string", "[util]") {
    REQUIRE(split("", ',').empty());
}

// ── split_shell_args ─────────────────────────────────────────────

TEST_CASE("split_shell_args: splits on unquoted whitespace", "[util]") {
    auto args = split_shell_args("ls  -la\t/tmp");
    REQUIRE(args == std::vector<std::string>{"ls", "-la", "/tmp"});
}

TEST_CASE("split_shell_args: double quotes group words", "[util]") {
    auto args = split_shell_args(R"("a b" c)");
    REQUIRE(args == std::vector<std::string>{"a b", "c"});
}

TEST_CASE("split_shell_args: single quotes group words", "[util]") {
    auto args = split_shell_args("grep 'hello world' file.txt");
    REQUIRE(args == std::vector<std::string>{"grep", "hello world", "file.txt"});
}

TEST_CASE("split_shell_args: quotes join adjacent text", "[util]") {
    auto args = split_shell_args(R"(--name="John Smith")");
    REQUIRE(args == std::vector<std::string>{"--name=John Smith"});
}

TEST_CASE("split_shell_args: other quote kind is literal inside quotes", "[util]") {
    auto args = split_shell_args(R"("it's" 'say "hi"')");
    REQUIRE(args == std::vector<std::string>{"it's", "say \"hi\""});
}

TEST_CASE("split_shell_args: backslash escapes space and quote", "[util]") {
    auto args = split_shell_args(R"(a\ b \"c)");
    REQUIRE(args == std::vector<std::string>{"a b", "\"c"});
}

TEST_CASE("split_shell_args: empty quoted argument is kept", "[util]") {
    auto args = split_shell_args(R"(x "" '' y)");
    REQUIRE(args == std::vector<std::string>{"x", "", "", "y"});
}

TEST_CASE("split_shell_args: trailing backslash stays literal", "[util]") {
    auto args = split_shell_args(R"(a b\)");
    REQUIRE(args == std::vector<std::string>{"a", "b\\"});
}

TEST_CASE("split_shell_args: empty and blank input give no args", "[util]") {
    REQUIRE(split_shell_args("").empty());
    REQUIRE(split_shell_args("   \t ").empty());
}

// ── join_shell_args ──────────────────────────────────────────────

TEST_CASE("join_shell_args: plain words are not quoted", "[util]") {
    REQUIRE(join_shell_args({"git", "status", "-s"}) == "git status -s");
}

TEST_CASE("join_shell_args: quotes words with spaces and metacharacters", "[util]") {
    REQUIRE(join_shell_args({"echo", "a b", "$HOME"}) == "echo 'a b' '$HOME'");
}

TEST_CASE("join_shell_args: escapes embedded single quote", "[util]") {
    REQUIRE(join_shell_args({"it's"}) == R"('it'\''s')");
}

TEST_CASE("join_shell_args: empty argument becomes empty quotes", "[util]") {
    REQUIRE(join_shell_args({"a", ""}) == "a ''");
}

TEST_CASE("join_shell_args: output splits back to the same arguments", "[util]") {
    std::vector<std::string> args = {"printf", "%s|", "one two", "", "x\"y"};
    REQUIRE(split_shell_args(join_shell_args({"a b", "c"})) ==
            std::vector<std::string>{"a b", "c"});
    REQUIRE(split_shell_args(join_shell_args(args)) == args);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto base = std::filesystem::temp_directory_path() / "toolbelt_util_XXXXXX";
    std::string tmpl = base.string();
    char* dir = mkdtemp(tmpl.data());
    REQUIRE(dir != nullptr);

    std::string path = std::string(dir) + "/nested/deeper/file.json";
    REQUIRE(atomic_write_file(path, "{\"a\":1}\n"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "{\"a\":1}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}
