// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/config.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/progress_parser.hpp>
#include <ariaflow/core/task_config.hpp>
#include <ariaflow/process/child_process.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <stop_token>
#include <thread>
#include <vector>

namespace ariaflow::core {

// Task lifecycle
enum class TaskState : std::uint8_t {
    waiting,     // Created, never started
    downloading, // Child process running
    paused,      // Child terminated by pause, partial file kept
    stopped,     // Stopped by user
    completed,   // Child reported success
    error        // Spawn, directory or exit-code failure
};

[[nodiscard]] std::string_view to_string(TaskState state) noexcept;

// One timestamped line of a task's log
struct LogEntry {
    std::chrono::system_clock::time_point time;
    std::string message;

    // "[YYYY-MM-DD HH:MM:SS] message" in local time
    [[nodiscard]] std::string formatted() const;
};

// Value copy of a task's observable state
struct TaskSnapshot {
    TaskState state{TaskState::waiting};
    std::optional<std::string> gid;
    int percent{0};
    std::uint64_t have_bytes{0};
    std::uint64_t total_bytes{0};     // 0 when the size is unknown
    std::string speed;
    std::string eta;
    int connections{0};
    bool process_running{false};
    std::uint32_t spawn_count{0};
    std::optional<int> last_exit_code;
    std::size_t log_size{0};
};

// Process-wide settings every task runs with
struct TaskEnvironment {
    std::string executable{DEFAULT_EXECUTABLE};
    std::size_t log_capacity{DEFAULT_LOG_CAPACITY};
    std::chrono::milliseconds terminate_grace{DEFAULT_TERMINATE_GRACE};
    std::shared_ptr<process::ProcessLauncher> launcher;   // Null = default_launcher()
};

// One transfer: owns its downloader process, the reader thread that
// drains the process output, the parsed progress fields and the log.
class Task {
public:
    Task(TaskConfig config, TaskEnvironment env);
    ~Task();

    // Non-copyable, non-movable (the reader thread holds this)
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&) noexcept = delete;
    Task& operator=(Task&&) noexcept = delete;

    // Spawn the downloader. No-op (already_running) while a process is alive.
    [[nodiscard]] std::error_code start() noexcept;

    // Terminate the process, keep the partial file. not_running if idle.
    [[nodiscard]] std::error_code pause() noexcept;

    // Terminate the process if any; status is Stopped afterwards either way
    std::error_code stop() noexcept;

    // Restart with the continue flag forced on
    [[nodiscard]] std::error_code resume() noexcept;

    // Append a timestamped entry to the task log
    void log(std::string_view message) noexcept;

    [[nodiscard]] TaskSnapshot snapshot() const noexcept;
    [[nodiscard]] TaskState state() const noexcept;
    [[nodiscard]] TaskConfig config() const;

    // Newest max_lines entries, oldest first; 0 returns the whole log
    [[nodiscard]] std::vector<std::string> log_lines(std::size_t max_lines = 0) const;

private:
    [[nodiscard]] std::error_code start_locked() noexcept;

    // Body of the reader thread
    void read_output(std::stop_token stoken, std::shared_ptr<process::Process> proc) noexcept;

    // Log one output line and fold it into the progress fields
    void handle_line(const std::string& line) noexcept;

    // Mark the live process as terminating and move to final_state;
    // caller holds mutex_ and has checked active_process_locked()
    [[nodiscard]] std::shared_ptr<process::Process> begin_termination_locked(TaskState final_state) noexcept;

    // SIGTERM the process, wake the reader and log message
    [[nodiscard]] std::error_code signal_termination(const std::shared_ptr<process::Process>& proc,
                                                     std::string_view message) noexcept;

    // Process alive and not already told to exit
    [[nodiscard]] bool active_process_locked() const noexcept;

    void append_log_locked(std::string message);
    void set_state_locked(TaskState next) noexcept;

    TaskEnvironment env_;

    std::mutex lifecycle_mutex_;   // Serializes start/pause/stop/resume
    mutable std::mutex mutex_;     // Guards everything below

    TaskConfig config_;
    TaskState state_{TaskState::waiting};
    std::shared_ptr<process::Process> process_;
    bool terminating_{false};      // Current process was asked to exit
    ProgressSample progress_;
    bool has_gid_{false};
    std::uint32_t spawn_count_{0};
    std::optional<int> last_exit_code_;
    std::deque<LogEntry> log_;

    std::jthread reader_;          // Last member: joined before the rest is destroyed
};

} // namespace ariaflow::core
