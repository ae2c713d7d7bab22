// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/task.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace ariaflow::core {

using TaskId = std::uint32_t;

enum class TaskVerb : std::uint8_t {
    start,
    pause,
    resume,
    stop,
    remove
};

[[nodiscard]] std::string_view to_string(TaskVerb verb) noexcept;
[[nodiscard]] std::expected<TaskVerb, std::error_code> parse_verb(std::string_view name) noexcept;

// Row of the task list
struct TaskSummary {
    TaskId id{0};
    std::string url;
    TaskState state{TaskState::waiting};
    int percent{0};
};

// Everything known about one task
struct TaskDetails {
    TaskId id{0};
    TaskConfig config;
    TaskSnapshot snapshot;
};

// Owns all tasks. Ids start at 1, are handed out in order and never reused.
class TaskRegistry {
public:
    explicit TaskRegistry(TaskEnvironment env = {});
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // Create a task in Waiting state
    [[nodiscard]] std::expected<TaskId, std::error_code> add(TaskConfig config) noexcept;

    // Delete a task; task_busy while it is Downloading
    [[nodiscard]] std::error_code remove(TaskId id) noexcept;

    // Run a lifecycle verb on the calling thread
    [[nodiscard]] std::error_code dispatch(TaskId id, TaskVerb verb) noexcept;

    // Run a lifecycle verb on a short-lived worker thread; only not_found
    // is reported here, the outcome lands in the task log
    [[nodiscard]] std::error_code dispatch_async(TaskId id, TaskVerb verb) noexcept;

    [[nodiscard]] std::error_code start(TaskId id) noexcept { return dispatch(id, TaskVerb::start); }
    [[nodiscard]] std::error_code pause(TaskId id) noexcept { return dispatch(id, TaskVerb::pause); }
    [[nodiscard]] std::error_code resume(TaskId id) noexcept { return dispatch(id, TaskVerb::resume); }
    [[nodiscard]] std::error_code stop(TaskId id) noexcept { return dispatch(id, TaskVerb::stop); }

    // Stop every task
    void stop_all() noexcept;

    // Pause every task that has a live process
    void pause_all() noexcept;

    [[nodiscard]] std::vector<TaskSummary> list() const noexcept;
    [[nodiscard]] std::expected<TaskDetails, std::error_code> details(TaskId id) const noexcept;
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    log(TaskId id, std::size_t max_lines = 0) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    // Wait for all async workers to finish
    void drain() noexcept;

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    [[nodiscard]] std::shared_ptr<Task> find(TaskId id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Task>> all_tasks() const;

    // Run a verb against an already resolved task
    [[nodiscard]] std::error_code run_verb(TaskId id, const std::shared_ptr<Task>& task, TaskVerb verb) noexcept;

    // Join and drop finished workers; caller holds workers_mutex_
    void reap_workers_locked() noexcept;

    TaskEnvironment env_;

    std::map<TaskId, std::shared_ptr<Task>> tasks_;
    TaskId next_id_{1};
    mutable std::mutex mutex_;

    std::list<Worker> workers_;
    std::mutex workers_mutex_;
};

} // namespace ariaflow::core
