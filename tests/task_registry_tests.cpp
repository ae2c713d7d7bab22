// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/task_registry.hpp>
#include "fake_process.hpp"
#include <filesystem>

using namespace ariaflow::core;
using ariaflow::testing::FakeLauncher;
using ariaflow::testing::eventually;

namespace {

struct RegistryFixture {
    std::shared_ptr<FakeLauncher> launcher = std::make_shared<FakeLauncher>();
    TaskRegistry registry{make_env(launcher)};

    static TaskEnvironment make_env(std::shared_ptr<FakeLauncher> l) {
        TaskEnvironment env;
        env.launcher = std::move(l);
        env.terminate_grace = std::chrono::milliseconds(200);
        return env;
    }

    TaskId add(std::string url) {
        TaskConfig config;
        config.url = std::move(url);
        config.output_dir = (std::filesystem::temp_directory_path() / "ariaflow_tests" / "registry").string();
        auto id = registry.add(std::move(config));
        REQUIRE(id.has_value());
        return *id;
    }

    TaskState state_of(TaskId id) {
        auto details = registry.details(id);
        REQUIRE(details.has_value());
        return details->snapshot.state;
    }
};

} // namespace

TEST_CASE_METHOD(RegistryFixture, "TaskRegistry - ids", "[registry]") {
    SECTION("Ids start at one and increase") {
        CHECK(add("http://example/a") == 1);
        CHECK(add("http://example/b") == 2);
        CHECK(add("http://example/c") == 3);
        CHECK(registry.size() == 3);
    }

    SECTION("Ids stay stable after removal and are never reused") {
        add("http://example/a");
        add("http://example/b");
        add("http://example/c");
        REQUIRE_FALSE(registry.remove(2));
        CHECK(add("http://example/d") == 4);

        auto rows = registry.list();
        REQUIRE(rows.size() == 3);
        CHECK(rows[0].id == 1);
        CHECK(rows[0].url == "http://example/a");
        CHECK(rows[1].id == 3);
        CHECK(rows[1].url == "http://example/c");
        CHECK(rows[2].id == 4);
        CHECK(rows[2].state == TaskState::waiting);
    }

    SECTION("Invalid configuration is rejected") {
        TaskConfig blank;
        blank.url = "   ";
        auto id = registry.add(blank);
        REQUIRE_FALSE(id.has_value());
        CHECK(id.error() == TaskErrc::invalid_config);

        TaskConfig zero_split;
        zero_split.url = "http://example/a";
        zero_split.options.split = 0;
        CHECK_FALSE(registry.add(zero_split).has_value());
        CHECK(registry.size() == 0);
    }
}

TEST_CASE_METHOD(RegistryFixture, "TaskRegistry - dispatch", "[registry]") {
    TaskId id = add("http://example/file.bin");

    SECTION("Lifecycle verbs reach the task") {
        REQUIRE_FALSE(registry.start(id));
        CHECK(state_of(id) == TaskState::downloading);
        REQUIRE_FALSE(registry.pause(id));
        CHECK(state_of(id) == TaskState::paused);
        REQUIRE_FALSE(registry.resume(id));
        CHECK(state_of(id) == TaskState::downloading);
        CHECK_FALSE(registry.stop(id));
        CHECK(state_of(id) == TaskState::stopped);
        CHECK(launcher->launches() == 2);
    }

    SECTION("Unknown id") {
        CHECK(registry.dispatch(99, TaskVerb::start) == TaskErrc::not_found);
        CHECK(registry.dispatch_async(99, TaskVerb::start) == TaskErrc::not_found);
        CHECK(registry.remove(99) == TaskErrc::not_found);
        CHECK_FALSE(registry.details(99).has_value());
        CHECK_FALSE(registry.log(99).has_value());
    }

    SECTION("Rejections are reported to the caller") {
        CHECK(registry.pause(id) == TaskErrc::not_running);
        REQUIRE_FALSE(registry.start(id));
        CHECK(registry.start(id) == TaskErrc::already_running);
        CHECK(launcher->launches() == 1);
    }

    SECTION("Asynchronous start") {
        REQUIRE_FALSE(registry.dispatch_async(id, TaskVerb::start));
        registry.drain();
        CHECK(state_of(id) == TaskState::downloading);
        CHECK(launcher->launches() == 1);
    }
}

TEST_CASE_METHOD(RegistryFixture, "TaskRegistry - remove", "[registry]") {
    TaskId id = add("http://example/file.bin");

    SECTION("Remove while downloading is rejected") {
        REQUIRE_FALSE(registry.start(id));
        CHECK(registry.remove(id) == TaskErrc::task_busy);
        CHECK(registry.size() == 1);
        auto log = registry.log(id, 1);
        REQUIRE(log.has_value());
        REQUIRE(log->size() == 1);
        CHECK(log->front().ends_with("Cannot delete a running task, stop it first"));
    }

    SECTION("Remove after stop") {
        REQUIRE_FALSE(registry.start(id));
        CHECK_FALSE(registry.stop(id));
        CHECK_FALSE(registry.remove(id));
        CHECK(registry.size() == 0);
    }

    SECTION("Remove through dispatch") {
        CHECK_FALSE(registry.dispatch(id, TaskVerb::remove));
        CHECK(registry.size() == 0);
    }

    SECTION("Asynchronous remove") {
        REQUIRE_FALSE(registry.dispatch_async(id, TaskVerb::remove));
        registry.drain();
        CHECK(registry.size() == 0);
    }
}

TEST_CASE_METHOD(RegistryFixture, "TaskRegistry - bulk operations", "[registry]") {
    TaskId a = add("http://example/a");
    TaskId b = add("http://example/b");
    TaskId c = add("http://example/c");
    REQUIRE_FALSE(registry.start(a));
    REQUIRE_FALSE(registry.start(b));

    SECTION("Pause all only touches running tasks") {
        registry.pause_all();
        CHECK(state_of(a) == TaskState::paused);
        CHECK(state_of(b) == TaskState::paused);
        CHECK(state_of(c) == TaskState::waiting);
    }

    SECTION("Stop all") {
        registry.stop_all();
        CHECK(state_of(a) == TaskState::stopped);
        CHECK(state_of(b) == TaskState::stopped);
        CHECK(state_of(c) == TaskState::stopped);
        CHECK(launcher->launches() == 2);
    }
}

TEST_CASE_METHOD(RegistryFixture, "TaskRegistry - details and log", "[registry]") {
    TaskId id = add("http://example/file.bin");
    REQUIRE_FALSE(registry.start(id));
    launcher->channel(0)->push("[#00 5MiB/10MiB(50%) CN:2 DL:2MiB ETA:10s]");
    launcher->channel(0)->finish(0);

    REQUIRE(eventually([&] { return state_of(id) == TaskState::completed; }));
    auto details = registry.details(id);
    REQUIRE(details.has_value());
    CHECK(details->id == id);
    CHECK(details->config.url == "http://example/file.bin");
    CHECK(details->snapshot.percent == 100);
    CHECK(details->snapshot.total_bytes == 10ULL * 1024 * 1024);

    auto log = registry.log(id);
    REQUIRE(log.has_value());
    CHECK(log->front().ends_with("Task added: http://example/file.bin"));
    CHECK(log->back().ends_with("Download completed"));
}

TEST_CASE("parse_verb", "[registry]") {
    CHECK(parse_verb("start") == TaskVerb::start);
    CHECK(parse_verb("pause") == TaskVerb::pause);
    CHECK(parse_verb("resume") == TaskVerb::resume);
    CHECK(parse_verb("stop") == TaskVerb::stop);
    CHECK(parse_verb("remove") == TaskVerb::remove);
    CHECK(parse_verb("delete") == TaskVerb::remove);
    REQUIRE_FALSE(parse_verb("explode").has_value());
    CHECK(parse_verb("explode").error() == TaskErrc::invalid_operation);
    CHECK(to_string(TaskVerb::resume) == "resume");
}
