// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/task_config.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ariaflow::core {

// Create the output directory (and parents) if missing
[[nodiscard]] std::error_code ensure_output_directory(const std::string& dir) noexcept;

// Build the downloader argument vector; element 0 is the executable.
// Creates the output directory as a side effect, failing with
// directory_creation_failed when it cannot.
[[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
build_command(std::string_view executable, const TaskConfig& config) noexcept;

// POSIX shell-style word splitting (quotes and backslash escapes).
// parse_error on an unterminated quote or a dangling backslash.
[[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
shell_split(std::string_view text) noexcept;

// Whitespace-only splitting, used when shell_split rejects the input
[[nodiscard]] std::vector<std::string> whitespace_split(std::string_view text);

// Render an argument vector for display in the task log
[[nodiscard]] std::string render_command(const std::vector<std::string>& argv);

} // namespace ariaflow::core
