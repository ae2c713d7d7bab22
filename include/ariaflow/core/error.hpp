// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace ariaflow::core {

enum class TaskErrc {
    success = 0,
    spawn_failed,
    process_exit,
    parse_error,
    directory_creation_failed,
    invalid_operation,
    already_running,
    already_completed,
    not_running,
    task_busy,
    not_found,
    invalid_config,
    config_file_error,
};

namespace detail {

struct TaskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ariaflow::task";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TaskErrc>(ev)) {
            case TaskErrc::success:                    return "Success";
            case TaskErrc::spawn_failed:               return "Failed to launch downloader process";
            case TaskErrc::process_exit:               return "Downloader exited with an error";
            case TaskErrc::parse_error:                return "Malformed progress output";
            case TaskErrc::directory_creation_failed:  return "Could not create output directory";
            case TaskErrc::invalid_operation:          return "Operation not allowed in current state";
            case TaskErrc::already_running:            return "Task is already running";
            case TaskErrc::already_completed:          return "Task already completed";
            case TaskErrc::not_running:                return "Task is not running";
            case TaskErrc::task_busy:                  return "Task is downloading, stop it first";
            case TaskErrc::not_found:                  return "No such task";
            case TaskErrc::invalid_config:             return "Invalid task configuration";
            case TaskErrc::config_file_error:          return "Could not read configuration file";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TaskErrcCategory& task_errc_category() noexcept {
    static detail::TaskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TaskErrc e) noexcept {
    return {static_cast<int>(e), task_errc_category()};
}

} // namespace ariaflow::core

namespace std {

template<>
struct is_error_code_enum<ariaflow::core::TaskErrc> : true_type {};

} // namespace std
