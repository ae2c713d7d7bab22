// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/logging.hpp>
#include <ariaflow/core/error.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace ariaflow::core {

namespace {

std::mutex logger_mutex;

} // namespace

std::shared_ptr<spdlog::logger> logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex);
    const std::string name(LOGGER_NAME);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    try {
        auto created = spdlog::stderr_color_mt(name);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        return created;
    } catch (const spdlog::spdlog_ex&) {
        // Sink creation failed; fall back to the default logger
        return spdlog::default_logger();
    }
}

void set_log_level(spdlog::level::level_enum level) noexcept {
    logger()->set_level(level);
}

std::expected<spdlog::level::level_enum, std::error_code>
parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::unexpected(make_error_code(TaskErrc::config_file_error));
}

} // namespace ariaflow::core
