// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/task.hpp>
#include <ariaflow/core/command_builder.hpp>
#include <ariaflow/core/logging.hpp>
#include <ctime>

namespace ariaflow::core {

std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::waiting:     return "Waiting";
        case TaskState::downloading: return "Downloading";
        case TaskState::paused:      return "Paused";
        case TaskState::stopped:     return "Stopped";
        case TaskState::completed:   return "Completed";
        case TaskState::error:       return "Error";
    }
    return "Unknown";
}

std::string LogEntry::formatted() const {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    char stamp[32];
    std::size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string out;
    out.reserve(n + message.size() + 3);
    out += '[';
    out.append(stamp, n);
    out += "] ";
    out += message;
    return out;
}

//=============================================================================
// Task
//=============================================================================

Task::Task(TaskConfig config, TaskEnvironment env)
    : env_(std::move(env))
    , config_(std::move(config)) {
    if (!env_.launcher) {
        env_.launcher = process::default_launcher();
    }
}

Task::~Task() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<process::Process> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proc = process_;
        terminating_ = true;
    }
    reader_.request_stop();
    if (proc) {
        // Escalation to SIGKILL happens in the reader
        (void)proc->terminate();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
}

std::error_code Task::start() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return start_locked();
}

std::error_code Task::start_locked() noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_process_locked()) {
                append_log_locked("Task is already in progress.");
                return make_error_code(TaskErrc::already_running);
            }
        }

        // A previous run may still be winding down after pause/stop
        if (reader_.joinable()) {
            reader_.join();
        }

        TaskConfig cfg = config();
        auto argv = build_command(env_.executable, cfg);
        if (!argv) {
            std::lock_guard<std::mutex> lock(mutex_);
            append_log_locked("Failed to prepare output directory " + cfg.resolved_output_dir() +
                              ": " + argv.error().message());
            set_state_locked(TaskState::error);
            return argv.error();
        }

        log("Start command: " + render_command(*argv));

        auto launched = env_.launcher->launch(*argv);
        if (!launched) {
            std::lock_guard<std::mutex> lock(mutex_);
            append_log_locked("Failed to start: " + launched.error().message());
            process_.reset();
            set_state_locked(TaskState::error);
            logger()->warn("could not launch '{}': {}", env_.executable, launched.error().message());
            return make_error_code(TaskErrc::spawn_failed);
        }

        std::shared_ptr<process::Process> proc = std::move(*launched);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            process_ = proc;
            terminating_ = false;
            last_exit_code_.reset();
            ++spawn_count_;
            set_state_locked(TaskState::downloading);
        }

        reader_ = std::jthread([this, proc](std::stop_token stoken) {
            read_output(stoken, proc);
        });
        return {};
    } catch (const std::exception& e) {
        log(std::string("Failed to start: ") + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        set_state_locked(TaskState::error);
        return make_error_code(TaskErrc::spawn_failed);
    }
}

std::error_code Task::pause() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<process::Process> proc;
    {
        // A child that exited before this point keeps the state the reader gave it
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_process_locked()) {
            append_log_locked("Task is not running, nothing to pause");
            return make_error_code(TaskErrc::not_running);
        }
        proc = begin_termination_locked(TaskState::paused);
    }
    return signal_termination(proc, "Download paused");
}

std::error_code Task::stop() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::shared_ptr<process::Process> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_process_locked()) {
            set_state_locked(TaskState::stopped);
            return {};
        }
        proc = begin_termination_locked(TaskState::stopped);
    }
    return signal_termination(proc, "Download stopped");
}

std::error_code Task::resume() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TaskState::completed) {
            append_log_locked("Task already completed, no need to resume");
            return make_error_code(TaskErrc::already_completed);
        }
        if (active_process_locked()) {
            append_log_locked("Task is still running, cannot resume");
            return make_error_code(TaskErrc::already_running);
        }
        append_log_locked("Resuming download (resume broken download)");
        config_.options.resume = true;
    }
    return start_locked();
}

std::shared_ptr<process::Process> Task::begin_termination_locked(TaskState final_state) noexcept {
    // State first, so the reader cannot classify the exit as an error
    terminating_ = true;
    set_state_locked(final_state);
    return process_;
}

std::error_code Task::signal_termination(const std::shared_ptr<process::Process>& proc,
                                         std::string_view message) noexcept {
    reader_.request_stop();
    if (auto ec = proc->terminate()) {
        std::lock_guard<std::mutex> lock(mutex_);
        append_log_locked("Failed to signal process: " + ec.message());
        return ec;
    }
    log(message);
    return {};
}

void Task::read_output(std::stop_token stoken, std::shared_ptr<process::Process> proc) noexcept {
    while (!stoken.stop_requested()) {
        auto result = proc->read_line(READ_POLL_INTERVAL);
        if (result.status == process::ReadStatus::timeout) {
            continue;
        }
        if (result.status == process::ReadStatus::eof) {
            break;
        }
        handle_line(result.text);
    }

    if (stoken.stop_requested() && !proc->wait_for(env_.terminate_grace)) {
        if (auto ec = proc->kill()) {
            logger()->error("failed to kill pid {}: {}", proc->pid(), ec.message());
        }
        log("Process ignored termination request, killed");
    }

    const int code = proc->wait();

    std::lock_guard<std::mutex> lock(mutex_);
    last_exit_code_ = code;
    if (process_ == proc) {
        process_.reset();
    }

    // pause/stop already chose the final state
    if (stoken.stop_requested() || state_ != TaskState::downloading) {
        return;
    }

    try {
        if (code == 0) {
            progress_.percent = 100;
            set_state_locked(TaskState::completed);
            append_log_locked("Download completed");
        } else {
            set_state_locked(TaskState::error);
            append_log_locked("Download error, return code: " + std::to_string(code));
        }
    } catch (const std::exception& e) {
        logger()->error("task log update failed: {}", e.what());
    }
}

void Task::handle_line(const std::string& line) noexcept {
    try {
        auto parsed = ProgressParser::parse(line);
        const bool finished = ProgressParser::signals_completion(line);

        std::lock_guard<std::mutex> lock(mutex_);
        append_log_locked(line);

        if (!parsed) {
            append_log_locked("Failed to parse progress: " + parsed.error().message());
        } else if (parsed->has_value()) {
            progress_ = std::move(**parsed);
            has_gid_ = true;
        }

        if (finished) {
            progress_.percent = 100;
            set_state_locked(TaskState::completed);
        }
    } catch (const std::exception& e) {
        logger()->error("dropping output line: {}", e.what());
    }
}

void Task::log(std::string_view message) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        append_log_locked(std::string(message));
    } catch (const std::exception& e) {
        logger()->error("task log append failed: {}", e.what());
    }
}

void Task::append_log_locked(std::string message) {
    log_.push_back(LogEntry{std::chrono::system_clock::now(), std::move(message)});
    if (env_.log_capacity > 0) {
        while (log_.size() > env_.log_capacity) {
            log_.pop_front();
        }
    }
}

void Task::set_state_locked(TaskState next) noexcept {
    if (state_ == next) return;
    logger()->debug("{}: {} -> {}", config_.url, to_string(state_), to_string(next));
    state_ = next;
}

bool Task::active_process_locked() const noexcept {
    return process_ && !terminating_ && process_->running();
}

TaskSnapshot Task::snapshot() const noexcept {
    std::shared_ptr<process::Process> proc;
    TaskSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.state = state_;
        if (has_gid_) {
            snap.gid = progress_.gid;
        }
        snap.percent = progress_.percent;
        snap.have_bytes = progress_.have_bytes;
        snap.total_bytes = progress_.total_bytes;
        snap.speed = progress_.speed;
        snap.eta = progress_.eta;
        snap.connections = progress_.connections;
        snap.spawn_count = spawn_count_;
        snap.last_exit_code = last_exit_code_;
        snap.log_size = log_.size();
        proc = process_;
    }
    snap.process_running = proc && proc->running();
    return snap;
}

TaskState Task::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TaskConfig Task::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::vector<std::string> Task::log_lines(std::size_t max_lines) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t skip = 0;
    if (max_lines > 0 && log_.size() > max_lines) {
        skip = log_.size() - max_lines;
    }

    std::vector<std::string> lines;
    lines.reserve(log_.size() - skip);
    for (auto it = log_.begin() + static_cast<std::ptrdiff_t>(skip); it != log_.end(); ++it) {
        lines.push_back(it->formatted());
    }
    return lines;
}

} // namespace ariaflow::core
