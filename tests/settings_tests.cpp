// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/logging.hpp>
#include <ariaflow/core/settings.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ariaflow::core;

namespace fs = std::filesystem;

TEST_CASE("Settings - defaults", "[settings]") {
    Settings s;
    CHECK(s.executable == "aria2c");
    CHECK(s.output_dir.empty());
    CHECK(s.defaults.resume);
    CHECK(s.defaults.split == DEFAULT_SPLIT);
    CHECK(s.defaults.file_allocation == "none");
    CHECK(s.log_capacity == DEFAULT_LOG_CAPACITY);
    CHECK(s.terminate_grace == DEFAULT_TERMINATE_GRACE);
    CHECK(s.log_level == spdlog::level::info);
}

TEST_CASE("Settings::from_json - full document", "[settings]") {
    auto s = Settings::from_json(R"({
        "executable": "/opt/aria2/bin/aria2c",
        "output_dir": "/downloads",
        "split": 8,
        "max_connection_per_server": 16,
        "max_tries": 5,
        "retry_wait": 10,
        "max_download_limit": "2M",
        "user_agent": "ariaflow",
        "referer": "http://example/",
        "headers": ["X-Token: abc", "Cookie: a=1"],
        "extra_args": "--check-certificate=false",
        "file_allocation": "falloc",
        "continue": false,
        "log_capacity": 500,
        "terminate_grace_ms": 1500,
        "log_level": "debug",
        "unknown_key": [1, 2, 3]
    })");
    REQUIRE(s.has_value());
    CHECK(s->executable == "/opt/aria2/bin/aria2c");
    CHECK(s->output_dir == "/downloads");
    CHECK(s->defaults.split == 8);
    CHECK(s->defaults.max_connection_per_server == 16);
    CHECK(s->defaults.max_tries == 5);
    CHECK(s->defaults.retry_wait == 10);
    CHECK(s->defaults.max_download_limit == "2M");
    CHECK(s->defaults.max_upload_limit.empty());
    CHECK(s->defaults.user_agent == "ariaflow");
    CHECK(s->defaults.referer == "http://example/");
    CHECK(s->defaults.headers == std::vector<std::string>{"X-Token: abc", "Cookie: a=1"});
    CHECK(s->defaults.extra_args == "--check-certificate=false");
    CHECK(s->defaults.file_allocation == "falloc");
    CHECK_FALSE(s->defaults.resume);
    CHECK(s->log_capacity == 500);
    CHECK(s->terminate_grace == std::chrono::milliseconds(1500));
    CHECK(s->log_level == spdlog::level::debug);
}

TEST_CASE("Settings::from_json - partial documents", "[settings]") {
    SECTION("Empty object keeps defaults") {
        auto s = Settings::from_json("{}");
        REQUIRE(s.has_value());
        CHECK(s->defaults.split == DEFAULT_SPLIT);
        CHECK_FALSE(s->defaults.max_connection_per_server.has_value());
    }

    SECTION("Single header string") {
        auto s = Settings::from_json(R"({"headers": "Authorization: Bearer x"})");
        REQUIRE(s.has_value());
        CHECK(s->defaults.headers == std::vector<std::string>{"Authorization: Bearer x"});
    }

    SECTION("Null values are ignored") {
        auto s = Settings::from_json(R"({"max_tries": null, "executable": null,
                                         "terminate_grace_ms": null, "log_capacity": null,
                                         "log_level": null})");
        REQUIRE(s.has_value());
        CHECK_FALSE(s->defaults.max_tries.has_value());
        CHECK(s->executable == "aria2c");
        CHECK(s->terminate_grace == DEFAULT_TERMINATE_GRACE);
        CHECK(s->log_capacity == DEFAULT_LOG_CAPACITY);
        CHECK(s->log_level == spdlog::level::info);
    }

    SECTION("Zero log capacity means unbounded") {
        auto s = Settings::from_json(R"({"log_capacity": 0, "max_tries": 0})");
        REQUIRE(s.has_value());
        CHECK(s->log_capacity == 0);
        CHECK(s->defaults.max_tries == 0);
    }
}

TEST_CASE("Settings::from_json - invalid documents", "[settings]") {
    SECTION("Malformed JSON") {
        auto s = Settings::from_json("{ split: 4 ");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == TaskErrc::config_file_error);
    }

    SECTION("Not an object") {
        CHECK(Settings::from_json("[1, 2]").error() == TaskErrc::config_file_error);
    }

    SECTION("Wrong value type") {
        CHECK(Settings::from_json(R"({"split": "four"})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"headers": 12})").error() == TaskErrc::config_file_error);
    }

    SECTION("Out of range values") {
        CHECK(Settings::from_json(R"({"split": 0})").error() == TaskErrc::invalid_config);
        CHECK(Settings::from_json(R"({"max_connection_per_server": 0})").error() == TaskErrc::invalid_config);
        CHECK(Settings::from_json(R"({"terminate_grace_ms": -1})").error() == TaskErrc::config_file_error);
    }

    SECTION("Numbers that do not fit are not narrowed") {
        CHECK(Settings::from_json(R"({"log_capacity": -1})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"split": 4294967297})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"max_connection_per_server": -4294967295})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"max_tries": -1})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"retry_wait": 18446744073709551615})").error() == TaskErrc::config_file_error);
        CHECK(Settings::from_json(R"({"terminate_grace_ms": 1.5})").error() == TaskErrc::config_file_error);
    }

    SECTION("Unknown log level") {
        CHECK(Settings::from_json(R"({"log_level": "loud"})").error() == TaskErrc::config_file_error);
    }
}

TEST_CASE("Settings::load and resolve", "[settings]") {
    auto dir = fs::temp_directory_path() / "ariaflow_tests" / "settings";
    fs::create_directories(dir);
    auto path = dir / "ariaflow.json";
    std::ofstream(path) << R"({"split": 6, "output_dir": "/srv/files"})";

    SECTION("Load from file") {
        auto s = Settings::load(path.string());
        REQUIRE(s.has_value());
        CHECK(s->defaults.split == 6);
        CHECK(s->output_dir == "/srv/files");
    }

    SECTION("Missing file") {
        auto s = Settings::load((dir / "missing.json").string());
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == TaskErrc::config_file_error);
    }

    SECTION("Explicit path wins over the environment") {
        ::setenv("ARIAFLOW_CONFIG", (dir / "missing.json").c_str(), 1);
        auto s = Settings::resolve(path.string());
        ::unsetenv("ARIAFLOW_CONFIG");
        REQUIRE(s.has_value());
        CHECK(s->defaults.split == 6);
    }

    SECTION("Environment variable") {
        ::setenv("ARIAFLOW_CONFIG", path.c_str(), 1);
        auto s = Settings::resolve("");
        ::unsetenv("ARIAFLOW_CONFIG");
        REQUIRE(s.has_value());
        CHECK(s->output_dir == "/srv/files");
    }

    SECTION("Built-in defaults") {
        ::unsetenv("ARIAFLOW_CONFIG");
        auto s = Settings::resolve("");
        REQUIRE(s.has_value());
        CHECK(s->defaults.split == DEFAULT_SPLIT);
    }
}

TEST_CASE("Settings - task construction", "[settings]") {
    Settings s;
    s.executable = "/usr/local/bin/aria2c";
    s.output_dir = "/downloads";
    s.defaults.split = 2;
    s.log_capacity = 42;
    s.terminate_grace = std::chrono::milliseconds(900);

    auto config = s.make_task("http://example/a.iso");
    CHECK(config.url == "http://example/a.iso");
    CHECK(config.output_dir == "/downloads");
    CHECK(config.output_name.empty());
    CHECK(config.options.split == 2);

    auto env = s.environment();
    CHECK(env.executable == "/usr/local/bin/aria2c");
    CHECK(env.log_capacity == 42);
    CHECK(env.terminate_grace == std::chrono::milliseconds(900));
    CHECK_FALSE(env.launcher);
}

TEST_CASE("parse_log_level", "[settings]") {
    CHECK(parse_log_level("trace") == spdlog::level::trace);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("verbose").has_value());
}
