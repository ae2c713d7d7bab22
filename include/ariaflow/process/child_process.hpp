// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <sys/types.h>

namespace ariaflow::process {

enum class ReadStatus : std::uint8_t {
    line,      // A complete line is in ReadResult::text
    timeout,   // Nothing arrived within the timeout
    eof        // Output stream closed and fully drained
};

struct ReadResult {
    ReadStatus status{ReadStatus::eof};
    std::string text;
};

// A running downloader with its merged stdout/stderr exposed as lines
class Process {
public:
    virtual ~Process() = default;

    // Next line of output; \n, \r and \r\n all terminate a line
    [[nodiscard]] virtual ReadResult read_line(std::chrono::milliseconds timeout) noexcept = 0;

    // False once the process has exited (reaps it)
    [[nodiscard]] virtual bool running() noexcept = 0;

    // Ask the process to exit (SIGTERM)
    [[nodiscard]] virtual std::error_code terminate() noexcept = 0;

    // Force the process to exit (SIGKILL)
    [[nodiscard]] virtual std::error_code kill() noexcept = 0;

    // Wait up to timeout for exit; true when it has exited
    [[nodiscard]] virtual bool wait_for(std::chrono::milliseconds timeout) noexcept = 0;

    // Block until exit and return the exit code
    // (128 + signal number when killed by a signal)
    [[nodiscard]] virtual int wait() noexcept = 0;

    [[nodiscard]] virtual pid_t pid() const noexcept = 0;
};

// Creates processes; swapped out in tests
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // argv[0] is the executable, looked up on PATH when it has no slash
    [[nodiscard]] virtual std::expected<std::unique_ptr<Process>, std::error_code>
    launch(const std::vector<std::string>& argv) noexcept = 0;
};

// POSIX child process spawned with posix_spawnp
class ChildProcess final : public Process {
public:
    ChildProcess(pid_t pid, int output_fd) noexcept;
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) noexcept = delete;
    ChildProcess& operator=(ChildProcess&&) noexcept = delete;

    [[nodiscard]] ReadResult read_line(std::chrono::milliseconds timeout) noexcept override;
    [[nodiscard]] bool running() noexcept override;
    [[nodiscard]] std::error_code terminate() noexcept override;
    [[nodiscard]] std::error_code kill() noexcept override;
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) noexcept override;
    [[nodiscard]] int wait() noexcept override;
    [[nodiscard]] pid_t pid() const noexcept override { return pid_; }

private:
    // Non-blocking reap; caller holds mutex_
    void poll_exit() noexcept;

    // Pop one complete line from buffer_ into out
    [[nodiscard]] bool take_line(std::string& out) noexcept;

    [[nodiscard]] std::error_code send_signal(int signo) noexcept;

    pid_t pid_;
    int output_fd_;
    std::string buffer_;
    bool eof_{false};
    bool skip_lf_{false};   // Last terminator was \r, swallow a following \n

    std::mutex mutex_;      // Guards exited_ / exit_code_
    bool exited_{false};
    int exit_code_{-1};
};

class PosixLauncher final : public ProcessLauncher {
public:
    [[nodiscard]] std::expected<std::unique_ptr<Process>, std::error_code>
    launch(const std::vector<std::string>& argv) noexcept override;
};

// Shared launcher used when none is injected
[[nodiscard]] std::shared_ptr<ProcessLauncher> default_launcher();

// Drop bytes that are not valid UTF-8
[[nodiscard]] std::string sanitize_utf8(std::string_view text);

} // namespace ariaflow::process
