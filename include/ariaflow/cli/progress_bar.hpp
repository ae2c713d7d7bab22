// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ariaflow/core/task_registry.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ariaflow::cli {

// One status row per task
class ProgressBar {
public:
    explicit ProgressBar(int width = 30) noexcept;

    // "#1 file.bin [=====>     ]  50% 5.0 MB/10.0 MB 2MiB/s ETA 10s CN:2 Downloading"
    [[nodiscard]] std::string render(const core::TaskDetails& task) const;

    [[nodiscard]] std::string render_bar(int percent) const;

    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string display_name(const core::TaskConfig& config);

private:
    int width_;
};

// Multi-line panel redrawn in place with ANSI cursor movement
class StatusPanel {
public:
    // Replace the previously drawn rows with these
    void draw(const std::vector<std::string>& rows) noexcept;

    // Forget the drawn rows so the next output starts below them
    void release() noexcept { previous_lines_ = 0; }

private:
    std::size_t previous_lines_{0};
};

} // namespace ariaflow::cli
