// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/task_config.hpp>
#include <ariaflow/core/error.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ariaflow::core {

std::error_code TaskConfig::validate() const noexcept {
    bool blank_url = std::all_of(url.begin(), url.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    if (blank_url) {
        return make_error_code(TaskErrc::invalid_config);
    }
    if (options.split < 1) {
        return make_error_code(TaskErrc::invalid_config);
    }
    if (options.max_connection_per_server && *options.max_connection_per_server < 1) {
        return make_error_code(TaskErrc::invalid_config);
    }
    return {};
}

std::string TaskConfig::resolved_output_dir() const {
    if (!output_dir.empty()) {
        return output_dir;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::string TaskConfig::save_path() const {
    if (output_name.empty()) {
        return resolved_output_dir();
    }
    return (std::filesystem::path(resolved_output_dir()) / output_name).string();
}

} // namespace ariaflow::core
