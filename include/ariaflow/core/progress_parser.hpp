// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ariaflow::core {

// Fields carried by one aria2 progress marker:
// [#<gid> <have>/<total>(<percent>%) CN:<connections> DL:<speed> ETA:<eta>]
struct ProgressSample {
    std::string gid;
    std::uint64_t have_bytes{0};
    std::uint64_t total_bytes{0};
    int percent{0};
    int connections{0};
    std::string speed;   // As printed, e.g. "1.5MiB"
    std::string eta;     // As printed, e.g. "1m0s"
};

class ProgressParser {
public:
    // Extract the marker from a line of downloader output.
    // nullopt when the line carries no marker, parse_error when a marker
    // was found but a numeric field could not be converted.
    [[nodiscard]] static std::expected<std::optional<ProgressSample>, std::error_code>
    parse(std::string_view line) noexcept;

    // True when the line announces completion in plain words
    // ("download complete", "completed", "download finished"), any case.
    [[nodiscard]] static bool signals_completion(std::string_view line) noexcept;
};

} // namespace ariaflow::core
