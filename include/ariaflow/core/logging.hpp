// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <expected>
#include <memory>
#include <string_view>
#include <system_error>

namespace ariaflow::core {

constexpr std::string_view LOGGER_NAME = "ariaflow";

// Shared diagnostic logger (stderr, colored). Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger() noexcept;

// Set the diagnostic log level for the whole process
void set_log_level(spdlog::level::level_enum level) noexcept;

// "trace", "debug", "info", "warn", "error", "off"
[[nodiscard]] std::expected<spdlog::level::level_enum, std::error_code>
parse_log_level(std::string_view name) noexcept;

} // namespace ariaflow::core
