#include <catch2/catch_test_macros.hpp>

#include "utils.h"
#include "test_helpers.h"

TEST_CASE("string helpers") {
    CHECK(utils::trim("  a b\t\r\n") == "a b");
    CHECK(utils::trim(" \t ").empty());
    CHECK(utils::to_lower("LocalForward") == "localforward");
    CHECK(utils::contains_whitespace("a b"));
    CHECK(!utils::contains_whitespace("ab"));
    CHECK(utils::starts_with("~/.ssh", "~/"));
    CHECK(!utils::starts_with("~", "~/"));
    CHECK(utils::ends_with("id_rsa.pub", ".pub"));
    CHECK(utils::join(std::vector<std::string>({"a", "b", "c"}), ", ") == "a, b, c");
    CHECK(utils::join(std::vector<std::string>(), ", ").empty());
    CHECK(utils::repeat("ab", 3) == "ababab");
}

TEST_CASE("splitting") {
    CHECK(utils::split("a,b,,c", ',') == std::vector<std::string>({"a", "b", "", "c"}));
    CHECK(utils::split_whitespace("  5432 \t db:5432 ") == std::vector<std::string>({"5432", "db:5432"}));
    CHECK(utils::split_whitespace("   ").empty());
}

TEST_CASE("port numbers") {
    uint16_t port = 0;
    CHECK(utils::safe_str_to_uint16("65535", port));
    CHECK(port == 65535);
    CHECK(utils::safe_str_to_uint16("0", port));
    CHECK(port == 0);
    CHECK(!utils::safe_str_to_uint16("65536", port));
    CHECK(!utils::safe_str_to_uint16("-1", port));
    CHECK(!utils::safe_str_to_uint16("80a", port));
    CHECK(!utils::safe_str_to_uint16("", port));
    CHECK(!utils::safe_str_to_uint16(" 80", port));
}

TEST_CASE("home expansion") {
    std::string home = utils::home_dir();
    REQUIRE(!home.empty());
    CHECK(utils::expand_home("~") == home);
    CHECK(utils::expand_home("~/.ssh/config") == home + "/.ssh/config");
    CHECK(utils::expand_home("/etc/ssh/ssh_config") == "/etc/ssh/ssh_config");
    CHECK(utils::expand_home("~other/x") == "~other/x");
}

TEST_CASE("files") {
    TempDir dir;
    REQUIRE(!dir.path().empty());
    std::string file = dir.write("note", "hello\n");

    CHECK(utils::file_exists(file));
    CHECK(utils::is_regular_file(file));
    CHECK(utils::file_exists(dir.path()));
    CHECK(!utils::is_regular_file(dir.path()));

    std::string content;
    REQUIRE(utils::read_file(file, content));
    CHECK(content == "hello\n");
    CHECK(!utils::read_file(dir.path() + "/missing", content));

    std::string log = dir.path() + "/a/b/app.log";
    REQUIRE(utils::ensure_log_file(log));
    CHECK(utils::is_regular_file(log));
}
