// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/settings.hpp>
#include <ariaflow/core/task_registry.hpp>
#include <atomic>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ariaflow::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Exit code after Ctrl-C (128 + SIGINT)
constexpr int EXIT_INTERRUPTED = 130;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string config_path;
    std::string executable;
    std::string output_dir;
    std::string output_file;
    std::optional<int> split;
    std::optional<int> max_connection_per_server;
    std::optional<int> max_tries;
    std::optional<int> retry_wait;
    std::string download_limit;
    std::string referer;
    std::string user_agent;
    std::vector<std::string> headers;
    std::string extra_args;
    bool no_continue{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;   // First problem found while parsing, empty if none
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Fold command line flags over the loaded settings
void apply_overrides(core::Settings& settings, const CliArgs& args);

// Add one task per URL, start them all and follow them until every task
// has settled. Returns 0 when all completed, 1 otherwise, 130 on interrupt.
[[nodiscard]] CliResult run(const CliArgs& args, const std::atomic<bool>& interrupted) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace ariaflow::cli
