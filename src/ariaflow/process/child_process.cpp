// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/process/child_process.hpp>
#include <ariaflow/core/config.hpp>
#include <ariaflow/core/logging.hpp>
#include <cstring>
#include <array>
#include <cerrno>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ariaflow::process {

namespace chrono = std::chrono;

namespace {

constexpr chrono::milliseconds EXIT_POLL_INTERVAL{20};

int decode_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Length of the UTF-8 sequence starting at text[i], 0 when invalid
std::size_t utf8_sequence_length(std::string_view text, std::size_t i) noexcept {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t len = 0;
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) len = 4;
    else return 0;

    if (i + len > text.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return 0;
    }
    const auto second = static_cast<unsigned char>(text[i + 1]);
    if (lead == 0xE0 && second < 0xA0) return 0;   // Overlong
    if (lead == 0xED && second > 0x9F) return 0;   // Surrogates
    if (lead == 0xF0 && second < 0x90) return 0;   // Overlong
    if (lead == 0xF4 && second > 0x8F) return 0;   // Beyond U+10FFFF
    return len;
}

} // namespace

std::string sanitize_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(text.substr(i, len));
        i += len;
    }
    return out;
}

//=============================================================================
// ChildProcess
//=============================================================================

ChildProcess::ChildProcess(pid_t pid, int output_fd) noexcept
    : pid_(pid)
    , output_fd_(output_fd) {}

ChildProcess::~ChildProcess() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        poll_exit();
        if (!exited_) {
            // Never leave an orphan behind
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            exited_ = true;
            exit_code_ = decode_status(status);
        }
    }
    if (output_fd_ >= 0) {
        ::close(output_fd_);
    }
}

bool ChildProcess::take_line(std::string& out) noexcept {
    if (skip_lf_ && !buffer_.empty()) {
        if (buffer_.front() == '\n') {
            buffer_.erase(0, 1);
        }
        skip_lf_ = false;
    }

    auto pos = buffer_.find_first_of("\r\n");
    if (pos == std::string::npos) {
        return false;
    }

    out.assign(buffer_, 0, pos);
    const bool is_cr = buffer_[pos] == '\r';
    buffer_.erase(0, pos + 1);
    if (is_cr) {
        if (!buffer_.empty()) {
            if (buffer_.front() == '\n') buffer_.erase(0, 1);
        } else {
            skip_lf_ = true;
        }
    }
    return true;
}

ReadResult ChildProcess::read_line(chrono::milliseconds timeout) noexcept {
    try {
        std::string line;
        if (take_line(line)) {
            return {ReadStatus::line, sanitize_utf8(line)};
        }

        const auto deadline = chrono::steady_clock::now() + timeout;
        std::array<char, core::READ_BUFFER_SIZE> chunk{};

        while (!eof_ && output_fd_ >= 0) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(
                deadline - chrono::steady_clock::now());
            if (remaining.count() < 0) remaining = chrono::milliseconds{0};

            pollfd pfd{output_fd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                eof_ = true;
                break;
            }
            if (ready == 0) {
                return {ReadStatus::timeout, {}};
            }

            ssize_t n = ::read(output_fd_, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                eof_ = true;
                break;
            }
            if (n == 0) {
                eof_ = true;
                break;
            }

            buffer_.append(chunk.data(), static_cast<std::size_t>(n));
            if (take_line(line)) {
                return {ReadStatus::line, sanitize_utf8(line)};
            }
            if (chrono::steady_clock::now() >= deadline) {
                return {ReadStatus::timeout, {}};
            }
        }

        // Stream closed: flush an unterminated last line first
        if (!buffer_.empty()) {
            line = std::move(buffer_);
            buffer_.clear();
            return {ReadStatus::line, sanitize_utf8(line)};
        }
        return {ReadStatus::eof, {}};
    } catch (const std::exception&) {
        eof_ = true;
        return {ReadStatus::eof, {}};
    }
}

void ChildProcess::poll_exit() noexcept {
    if (exited_) return;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exited_ = true;
        exit_code_ = decode_status(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; exit code is lost
        exited_ = true;
    }
}

bool ChildProcess::running() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    poll_exit();
    return !exited_;
}

std::error_code ChildProcess::send_signal(int signo) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    poll_exit();
    if (exited_) {
        return {};
    }
    if (::kill(pid_, signo) != 0) {
        return {errno, std::system_category()};
    }
    return {};
}

std::error_code ChildProcess::terminate() noexcept {
    return send_signal(SIGTERM);
}

std::error_code ChildProcess::kill() noexcept {
    return send_signal(SIGKILL);
}

bool ChildProcess::wait_for(chrono::milliseconds timeout) noexcept {
    const auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            poll_exit();
            if (exited_) return true;
        }
        if (chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
}

int ChildProcess::wait() noexcept {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            poll_exit();
            if (exited_) return exit_code_;
        }
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
}

//=============================================================================
// PosixLauncher
//=============================================================================

std::expected<std::unique_ptr<Process>, std::error_code>
PosixLauncher::launch(const std::vector<std::string>& argv) noexcept {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);

    // stdout and stderr share the pipe, stdin is empty
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    // Own process group so a terminal Ctrl-C reaches the supervisor only
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGHUP);
    sigset_t no_mask;
    sigemptyset(&no_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setsigmask(&attr, &no_mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETPGROUP);

    int rc = 0;
    pid_t pid = -1;
    try {
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            cargv.push_back(const_cast<char*>(arg.c_str()));
        }
        cargv.push_back(nullptr);

        rc = posix_spawnp(&pid, cargv[0], &actions, &attr, cargv.data(), environ);
    } catch (const std::bad_alloc&) {
        rc = ENOMEM;
    }

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    ::close(fds[1]);

    if (rc != 0) {
        ::close(fds[0]);
        core::logger()->debug("spawn of '{}' failed: {}", argv.front(), std::strerror(rc));
        return std::unexpected(std::error_code(rc, std::system_category()));
    }

    core::logger()->debug("spawned '{}' as pid {}", argv.front(), pid);
    try {
        return std::unique_ptr<Process>(std::make_unique<ChildProcess>(pid, fds[0]));
    } catch (const std::bad_alloc&) {
        // Reap instead of leaking the child
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(fds[0]);
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::shared_ptr<ProcessLauncher> default_launcher() {
    static auto launcher = std::make_shared<PosixLauncher>();
    return launcher;
}

} // namespace ariaflow::process
