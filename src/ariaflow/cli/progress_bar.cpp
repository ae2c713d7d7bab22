// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/cli/progress_bar.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace ariaflow::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(int width) noexcept
    : width_(std::max(width, 1)) {}

std::string ProgressBar::render(const core::TaskDetails& task) const {
    const auto& snap = task.snapshot;

    std::string line = fmt::format("#{:<3} {:<24.24} {} {:>3}%",
                                   task.id, display_name(task.config),
                                   render_bar(snap.percent), snap.percent);

    if (snap.total_bytes > 0) {
        line += fmt::format(" {}/{}", format_bytes(snap.have_bytes), format_bytes(snap.total_bytes));
    }
    if (snap.state == core::TaskState::downloading) {
        if (!snap.speed.empty()) {
            line += fmt::format(" {}/s", snap.speed);
        }
        if (!snap.eta.empty()) {
            line += fmt::format(" ETA {}", snap.eta);
        }
        if (snap.connections > 0) {
            line += fmt::format(" CN:{}", snap.connections);
        }
    }
    line += fmt::format(" {}", core::to_string(snap.state));
    return line;
}

std::string ProgressBar::render_bar(int percent) const {
    percent = std::clamp(percent, 0, 100);
    const int filled = static_cast<int>(std::round(width_ * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width_) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width_ - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    } else if (bytes >= GB) {
        return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::display_name(const core::TaskConfig& config) {
    if (!config.output_name.empty()) {
        return config.output_name;
    }

    // Last path segment of the URL, without query or fragment
    std::string_view url = config.url;
    if (auto cut = url.find_first_of("?#"); cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    auto slash = url.rfind('/');
    auto name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    return name.empty() ? config.url : std::string(name);
}

//=============================================================================
// StatusPanel
//=============================================================================

void StatusPanel::draw(const std::vector<std::string>& rows) noexcept {
    try {
        std::string panel;
        for (const auto& row : rows) {
            panel += row;
            panel += "\033[K\n";
        }
        if (previous_lines_ > 0) {
            std::cout << "\033[" << previous_lines_ << "F\033[J";
        }
        std::cout << panel << std::flush;
        previous_lines_ = rows.size();
    } catch (const std::exception&) {
        previous_lines_ = 0;
    }
}

} // namespace ariaflow::cli
