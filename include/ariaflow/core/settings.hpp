// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/task.hpp>
#include <ariaflow/core/task_config.hpp>
#include <spdlog/common.h>
#include <chrono>
#include <optional>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace ariaflow::core {

// Supervisor configuration: built-in defaults, overridden by a JSON file,
// overridden again by command line flags
struct Settings {
    std::string executable{DEFAULT_EXECUTABLE};
    std::string output_dir;
    TaskOptions defaults;                           // Template for new tasks
    std::size_t log_capacity{DEFAULT_LOG_CAPACITY};
    std::chrono::milliseconds terminate_grace{DEFAULT_TERMINATE_GRACE};
    spdlog::level::level_enum log_level{spdlog::level::info};

    // Parse a JSON document; unknown keys are ignored, missing keys keep defaults
    [[nodiscard]] static std::expected<Settings, std::error_code>
    from_json(std::string_view text) noexcept;

    // Read and parse a JSON file
    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::string& path) noexcept;

    // explicit_path if given, else $ARIAFLOW_CONFIG if set, else defaults
    [[nodiscard]] static std::expected<Settings, std::error_code>
    resolve(const std::string& explicit_path) noexcept;

    [[nodiscard]] TaskEnvironment environment() const;

    // A task for url using the configured defaults
    [[nodiscard]] TaskConfig make_task(std::string url) const;
};

} // namespace ariaflow::core
