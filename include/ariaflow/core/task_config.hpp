// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/config.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ariaflow::core {

// Options forwarded to the downloader executable
struct TaskOptions {
    bool resume{true};                                   // -c
    std::string file_allocation{DEFAULT_FILE_ALLOCATION};
    int split{DEFAULT_SPLIT};
    std::optional<int> max_connection_per_server;        // Defaults to split
    std::optional<int> max_tries;
    std::optional<int> retry_wait;
    std::string max_download_limit;                      // e.g. "2M", empty = unlimited
    std::string max_upload_limit;
    std::string referer;
    std::string user_agent;
    std::vector<std::string> headers;                    // Raw "Name: value" lines
    std::string extra_args;                              // Shell-tokenized
};

// Everything needed to (re)launch one transfer
struct TaskConfig {
    std::string url;
    std::string output_dir;                              // Empty = current directory
    std::string output_name;                             // Empty = downloader picks
    TaskOptions options;

    // Reject configurations the downloader would refuse
    [[nodiscard]] std::error_code validate() const noexcept;

    // Output directory with the empty-means-cwd rule applied
    [[nodiscard]] std::string resolved_output_dir() const;

    // Directory + filename, or just the directory when no filename was given
    [[nodiscard]] std::string save_path() const;
};

} // namespace ariaflow::core
