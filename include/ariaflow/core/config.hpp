// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace ariaflow::core {

constexpr std::string_view DEFAULT_EXECUTABLE = "aria2c";
constexpr std::string_view DEFAULT_FILE_ALLOCATION = "none";
constexpr std::string_view CONFIG_ENV_VAR = "ARIAFLOW_CONFIG";

constexpr int DEFAULT_SPLIT = 4;

constexpr std::size_t DEFAULT_LOG_CAPACITY = 10'000;               // Entries per task, 0 = unbounded

// Time allowed between SIGTERM and SIGKILL
constexpr std::chrono::milliseconds DEFAULT_TERMINATE_GRACE{5000};

// How often the reader wakes up to check its stop flag
constexpr std::chrono::milliseconds READ_POLL_INTERVAL{100};

constexpr std::chrono::milliseconds CLI_REFRESH_INTERVAL{500};

constexpr std::size_t READ_BUFFER_SIZE = 4096;

} // namespace ariaflow::core
