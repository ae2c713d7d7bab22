// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/task_registry.hpp>
#include <ariaflow/core/logging.hpp>
#include <utility>

namespace ariaflow::core {

std::string_view to_string(TaskVerb verb) noexcept {
    switch (verb) {
        case TaskVerb::start:  return "start";
        case TaskVerb::pause:  return "pause";
        case TaskVerb::resume: return "resume";
        case TaskVerb::stop:   return "stop";
        case TaskVerb::remove: return "remove";
    }
    return "unknown";
}

std::expected<TaskVerb, std::error_code> parse_verb(std::string_view name) noexcept {
    if (name == "start")  return TaskVerb::start;
    if (name == "pause")  return TaskVerb::pause;
    if (name == "resume") return TaskVerb::resume;
    if (name == "stop")   return TaskVerb::stop;
    if (name == "remove" || name == "delete") return TaskVerb::remove;
    return std::unexpected(make_error_code(TaskErrc::invalid_operation));
}

//=============================================================================
// TaskRegistry
//=============================================================================

TaskRegistry::TaskRegistry(TaskEnvironment env)
    : env_(std::move(env)) {
    if (!env_.launcher) {
        env_.launcher = process::default_launcher();
    }
}

TaskRegistry::~TaskRegistry() {
    drain();

    // Destroy tasks outside the lock; each one stops its own process
    std::map<TaskId, std::shared_ptr<Task>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doomed.swap(tasks_);
    }
}

std::expected<TaskId, std::error_code> TaskRegistry::add(TaskConfig config) noexcept {
    if (auto ec = config.validate()) {
        logger()->warn("rejected task '{}': {}", config.url, ec.message());
        return std::unexpected(ec);
    }

    try {
        auto task = std::make_shared<Task>(std::move(config), env_);

        std::lock_guard<std::mutex> lock(mutex_);
        TaskId id = next_id_++;
        task->log("Task added: " + task->config().url);
        tasks_.emplace(id, std::move(task));
        logger()->info("task {} added", id);
        return id;
    } catch (const std::exception& e) {
        logger()->error("could not add task: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }
}

std::error_code TaskRegistry::remove(TaskId id) noexcept {
    std::shared_ptr<Task> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return make_error_code(TaskErrc::not_found);
        }
        if (it->second->state() == TaskState::downloading) {
            it->second->log("Cannot delete a running task, stop it first");
            return make_error_code(TaskErrc::task_busy);
        }
        removed = std::move(it->second);
        tasks_.erase(it);
    }
    logger()->info("task {} removed", id);
    // Task destructor (reader join) runs here, outside the registry lock
    return {};
}

std::error_code TaskRegistry::dispatch(TaskId id, TaskVerb verb) noexcept {
    if (verb == TaskVerb::remove) {
        return remove(id);
    }
    auto task = find(id);
    if (!task) {
        return make_error_code(TaskErrc::not_found);
    }
    return run_verb(id, task, verb);
}

std::error_code TaskRegistry::dispatch_async(TaskId id, TaskVerb verb) noexcept {
    auto task = find(id);
    if (!task) {
        return make_error_code(TaskErrc::not_found);
    }

    try {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        reap_workers_locked();

        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker worker;
        worker.done = done;
        worker.thread = std::jthread([this, id, task, verb, done] {
            std::error_code ec = verb == TaskVerb::remove ? remove(id) : run_verb(id, task, verb);
            if (ec) {
                logger()->debug("async {} on task {}: {}", to_string(verb), id, ec.message());
            }
            done->store(true, std::memory_order_release);
        });
        workers_.push_back(std::move(worker));
        return {};
    } catch (const std::system_error& e) {
        logger()->error("could not start worker for task {}: {}", id, e.what());
        return e.code();
    } catch (const std::exception& e) {
        logger()->error("could not start worker for task {}: {}", id, e.what());
        return make_error_code(TaskErrc::invalid_operation);
    }
}

std::error_code TaskRegistry::run_verb(TaskId id, const std::shared_ptr<Task>& task, TaskVerb verb) noexcept {
    std::error_code ec;
    switch (verb) {
        case TaskVerb::start:  ec = task->start(); break;
        case TaskVerb::pause:  ec = task->pause(); break;
        case TaskVerb::resume: ec = task->resume(); break;
        case TaskVerb::stop:   ec = task->stop(); break;
        case TaskVerb::remove: return remove(id);
    }

    if (ec) {
        logger()->info("task {}: {} rejected: {}", id, to_string(verb), ec.message());
    } else {
        logger()->info("task {}: {}", id, to_string(verb));
    }
    return ec;
}

void TaskRegistry::stop_all() noexcept {
    for (const auto& task : all_tasks()) {
        (void)task->stop();
    }
}

void TaskRegistry::pause_all() noexcept {
    for (const auto& task : all_tasks()) {
        if (task->state() == TaskState::downloading) {
            (void)task->pause();
        }
    }
}

std::vector<TaskSummary> TaskRegistry::list() const noexcept {
    std::vector<std::pair<TaskId, std::shared_ptr<Task>>> entries;
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries.assign(tasks_.begin(), tasks_.end());
        }

        std::vector<TaskSummary> rows;
        rows.reserve(entries.size());
        for (const auto& [id, task] : entries) {
            auto snap = task->snapshot();
            rows.push_back(TaskSummary{id, task->config().url, snap.state, snap.percent});
        }
        return rows;
    } catch (const std::exception& e) {
        logger()->error("task listing failed: {}", e.what());
        return {};
    }
}

std::expected<TaskDetails, std::error_code> TaskRegistry::details(TaskId id) const noexcept {
    try {
        auto task = find(id);
        if (!task) {
            return std::unexpected(make_error_code(TaskErrc::not_found));
        }
        return TaskDetails{id, task->config(), task->snapshot()};
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::invalid_operation));
    }
}

std::expected<std::vector<std::string>, std::error_code>
TaskRegistry::log(TaskId id, std::size_t max_lines) const noexcept {
    try {
        auto task = find(id);
        if (!task) {
            return std::unexpected(make_error_code(TaskErrc::not_found));
        }
        return task->log_lines(max_lines);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::invalid_operation));
    }
}

std::size_t TaskRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskRegistry::drain() noexcept {
    std::list<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        pending.swap(workers_);
    }
    for (auto& worker : pending) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void TaskRegistry::reap_workers_locked() noexcept {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<Task> TaskRegistry::find(TaskId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Task>> TaskRegistry::all_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Task>> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    return out;
}

} // namespace ariaflow::core
