#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "test_helpers.h"

TEST_CASE("defaults") {
    Config config;
    CHECK(config.ssh_config == "~/.ssh/config");
    CHECK(config.log_level == "INFO");
    CHECK(config.tty_device == "/dev/tty");
    CHECK(config.poll_timeout_ms == 100);
    CHECK(config.redraw_interval_ms == 50);
    CHECK(config.escape_timeout_ms == 50);
    CHECK(config.color);
}

TEST_CASE("parse overrides") {
    Config config = Config::parse_json(
        "{\n"
        "  \"ssh_config\": \"/etc/ssh/custom \\\"q\\\"\",\n"
        "  \"log_level\": \"DEBUG\",\n"
        "  \"escape_timeout_ms\": 25,\n"
        "  \"color\": false,\n"
        "  \"unknown\": {\"nested\": [1, 2, 3]}\n"
        "}\n");

    CHECK(config.ssh_config == "/etc/ssh/custom \"q\"");
    CHECK(config.log_level == "DEBUG");
    CHECK(config.escape_timeout_ms == 25);
    CHECK(!config.color);
    CHECK(config.poll_timeout_ms == 100);
    CHECK(config.tty_device == "/dev/tty");
}

TEST_CASE("bad values fall back to defaults") {
    SECTION("malformed document") {
        Config config = Config::parse_json("{\"log_level\": ");
        CHECK(config.log_level == "INFO");
    }
    SECTION("wrong types and zero timeouts") {
        Config config = Config::parse_json(
            "{\"log_level\": 3, \"poll_timeout_ms\": 0, \"redraw_interval_ms\": \"fast\", \"color\": \"no\"}");
        CHECK(config.log_level == "INFO");
        CHECK(config.poll_timeout_ms == 100);
        CHECK(config.redraw_interval_ms == 50);
        CHECK(config.color);
    }
    SECTION("timeouts out of range") {
        Config config = Config::parse_json(
            "{\"poll_timeout_ms\": 4294967295, \"escape_timeout_ms\": 10001, \"redraw_interval_ms\": 10000}");
        CHECK(config.poll_timeout_ms == 100);
        CHECK(config.escape_timeout_ms == 50);
        CHECK(config.redraw_interval_ms == 10000);
    }
    SECTION("empty string keeps the default") {
        Config config = Config::parse_json("{\"tty_device\": \"\"}");
        CHECK(config.tty_device == "/dev/tty");
    }
    SECTION("missing file") {
        Config config = Config::load("/nonexistent/config.json");
        CHECK(config.ssh_config == "~/.ssh/config");
    }
}

TEST_CASE("save and load") {
    TempDir dir;
    REQUIRE(!dir.path().empty());
    std::string path = dir.path() + "/nested/config.json";

    Config config;
    config.ssh_config = dir.path() + "/ssh_config";
    config.redraw_interval_ms = 75;
    config.color = false;
    REQUIRE(config.save(path));

    Config loaded = Config::load(path);
    CHECK(loaded.ssh_config == config.ssh_config);
    CHECK(loaded.redraw_interval_ms == 75);
    CHECK(!loaded.color);
    CHECK(loaded.to_json() == config.to_json());
}
