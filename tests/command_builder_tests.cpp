// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ariaflow/core/command_builder.hpp>
#include <ariaflow/core/error.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace ariaflow::core;

namespace fs = std::filesystem;

namespace {

bool contains(const std::vector<std::string>& argv, std::string_view arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

fs::path scratch_dir(std::string_view name) {
    auto dir = fs::temp_directory_path() / "ariaflow_tests" / name;
    fs::remove_all(dir);
    return dir;
}

TaskConfig make_config(const fs::path& dir) {
    TaskConfig config;
    config.url = "http://example/file.bin";
    config.output_dir = dir.string();
    return config;
}

} // namespace

TEST_CASE("build_command - defaults", "[command]") {
    auto dir = scratch_dir("defaults");
    auto argv = build_command("aria2c", make_config(dir));
    REQUIRE(argv.has_value());

    SECTION("Executable first, URL last") {
        CHECK(argv->front() == "aria2c");
        CHECK(argv->back() == "http://example/file.bin");
    }

    SECTION("Connection count defaults to split") {
        CHECK(contains(*argv, "--split=4"));
        CHECK(contains(*argv, "--max-connection-per-server=4"));
    }

    SECTION("Continue flag and file allocation") {
        CHECK((*argv)[1] == "-c");
        CHECK(contains(*argv, "--file-allocation=none"));
        CHECK(contains(*argv, "--allow-overwrite=true"));
        CHECK(contains(*argv, "--auto-file-renaming=false"));
    }

    SECTION("Directory flag without filename flag") {
        auto d = std::find(argv->begin(), argv->end(), "-d");
        REQUIRE(d != argv->end());
        REQUIRE(d + 1 != argv->end());
        CHECK(*(d + 1) == dir.string());
        CHECK_FALSE(contains(*argv, "-o"));
    }

    SECTION("Output directory is created") {
        CHECK(fs::is_directory(dir));
    }
}

TEST_CASE("build_command - options", "[command]") {
    auto dir = scratch_dir("options");
    TaskConfig config = make_config(dir);

    SECTION("Resume disabled drops the continue flag") {
        config.options.resume = false;
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        CHECK_FALSE(contains(*argv, "-c"));
    }

    SECTION("Explicit connection count and filename") {
        config.options.split = 8;
        config.options.max_connection_per_server = 2;
        config.output_name = "out.bin";
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        CHECK(contains(*argv, "--split=8"));
        CHECK(contains(*argv, "--max-connection-per-server=2"));
        auto o = std::find(argv->begin(), argv->end(), "-o");
        REQUIRE(o != argv->end());
        CHECK(*(o + 1) == "out.bin");
    }

    SECTION("Optional flags only when set") {
        auto plain = build_command("aria2c", config);
        REQUIRE(plain.has_value());
        for (const auto& arg : *plain) {
            CHECK_FALSE(arg.starts_with("--max-tries"));
            CHECK_FALSE(arg.starts_with("--referer"));
            CHECK_FALSE(arg.starts_with("--header"));
        }

        config.options.max_tries = 5;
        config.options.retry_wait = 10;
        config.options.max_download_limit = "2M";
        config.options.max_upload_limit = "512K";
        config.options.referer = "http://example/";
        config.options.user_agent = "ariaflow";
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        CHECK(contains(*argv, "--max-tries=5"));
        CHECK(contains(*argv, "--retry-wait=10"));
        CHECK(contains(*argv, "--max-download-limit=2M"));
        CHECK(contains(*argv, "--max-upload-limit=512K"));
        CHECK(contains(*argv, "--referer=http://example/"));
        CHECK(contains(*argv, "--user-agent=ariaflow"));
    }

    SECTION("Header blocks are split per line and trimmed") {
        config.options.headers = {"Cookie: a=1\n  \nX-Token: abc  ", "Accept: */*"};
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        CHECK(contains(*argv, "--header=Cookie: a=1"));
        CHECK(contains(*argv, "--header=X-Token: abc"));
        CHECK(contains(*argv, "--header=Accept: */*"));
        CHECK(std::count_if(argv->begin(), argv->end(),
                            [](const std::string& a) { return a.starts_with("--header="); }) == 3);
    }

    SECTION("Extra arguments go before the URL") {
        config.options.extra_args = "--check-certificate=false --dir-mode 'a b'";
        config.url = "  http://example/file.bin  ";
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        REQUIRE(argv->size() >= 4);
        auto n = argv->size();
        CHECK((*argv)[n - 4] == "--check-certificate=false");
        CHECK((*argv)[n - 3] == "--dir-mode");
        CHECK((*argv)[n - 2] == "a b");
        CHECK((*argv)[n - 1] == "http://example/file.bin");
    }

    SECTION("Malformed extra arguments fall back to whitespace splitting") {
        config.options.extra_args = "--foo 'bar";
        auto argv = build_command("aria2c", config);
        REQUIRE(argv.has_value());
        CHECK(contains(*argv, "--foo"));
        CHECK(contains(*argv, "'bar"));
    }
}

TEST_CASE("build_command - unusable output directory", "[command]") {
    auto dir = scratch_dir("blocked");
    fs::create_directories(dir);
    auto file = dir / "not_a_dir";
    std::ofstream(file) << "x";

    auto argv = build_command("aria2c", make_config(file / "sub"));
    REQUIRE_FALSE(argv.has_value());
    CHECK(argv.error() == TaskErrc::directory_creation_failed);
}

TEST_CASE("shell_split", "[command]") {
    SECTION("Plain words") {
        auto tokens = shell_split("  -a  b\tc ");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == std::vector<std::string>{"-a", "b", "c"});
    }

    SECTION("Quotes and escapes") {
        auto tokens = shell_split(R"(--x='a b' "c \"d\"" e\ f '' "$\q")");
        REQUIRE(tokens.has_value());
        CHECK(*tokens == std::vector<std::string>{"--x=a b", "c \"d\"", "e f", "", "$\\q"});
    }

    SECTION("Empty input") {
        auto tokens = shell_split("   ");
        REQUIRE(tokens.has_value());
        CHECK(tokens->empty());
    }

    SECTION("Unterminated quote") {
        auto tokens = shell_split("'abc");
        REQUIRE_FALSE(tokens.has_value());
        CHECK(tokens.error() == TaskErrc::parse_error);
    }

    SECTION("Dangling backslash") {
        CHECK_FALSE(shell_split("abc\\").has_value());
    }
}

TEST_CASE("render_command", "[command]") {
    CHECK(render_command({"aria2c", "-c", "--split=4"}) == "aria2c -c --split=4");
    CHECK(render_command({"aria2c", "-d", "/tmp/my files"}) == "aria2c -d '/tmp/my files'");
    CHECK(render_command({"echo", "it's", ""}) == R"(echo 'it'\''s' '')");
}
