// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/progress_parser.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/units.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <regex>

namespace ariaflow::core {

namespace {

// Capture groups of MARKER_PATTERN
enum Capture : std::size_t {
    CAP_GID = 1,
    CAP_HAVE,
    CAP_TOTAL,
    CAP_PERCENT,
    CAP_CONNECTIONS,
    CAP_SPEED,
    CAP_ETA,
};

// Matched against one "[#...]" window, never the whole line; std::regex
// recurses per character, so the window length is capped as well
constexpr const char* MARKER_PATTERN =
    R"(\[#([0-9a-f]{1,32})\s+([0-9.\w]{1,32})/([0-9.\w]{1,32})\(([0-9]{1,16})%\)\s+CN:([0-9]{1,16})\s+DL:([0-9.\w]{1,32})\s+ETA:([^\]]{1,128})\])";

constexpr std::size_t MAX_MARKER_LENGTH = 512;

constexpr std::array<std::string_view, 3> COMPLETION_PHRASES = {
    "download complete",
    "completed",
    "download finished",
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool parse_int(std::string_view text, int& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

std::expected<std::optional<ProgressSample>, std::error_code>
ProgressParser::parse(std::string_view line) noexcept {
    try {
        static const std::regex marker_regex(MARKER_PATTERN, std::regex::ECMAScript | std::regex::icase);

        // Try each "[#" ... "]" window in turn
        std::match_results<std::string_view::const_iterator> match;
        std::string_view window;
        bool found = false;
        std::size_t close = 0;
        for (auto open = line.find("[#"); open != std::string_view::npos; open = line.find("[#", open + 2)) {
            if (close <= open) {
                close = line.find(']', open);
                if (close == std::string_view::npos) {
                    break;
                }
            }
            window = line.substr(open, close - open + 1);
            if (window.size() <= MAX_MARKER_LENGTH &&
                std::regex_match(window.begin(), window.end(), match, marker_regex)) {
                found = true;
                break;
            }
        }
        if (!found) {
            return std::optional<ProgressSample>{};
        }

        auto group = [&](Capture c) {
            return window.substr(static_cast<std::size_t>(match.position(c)),
                                 static_cast<std::size_t>(match.length(c)));
        };

        ProgressSample sample;
        if (!parse_int(group(CAP_PERCENT), sample.percent) ||
            !parse_int(group(CAP_CONNECTIONS), sample.connections)) {
            return std::unexpected(make_error_code(TaskErrc::parse_error));
        }
        sample.percent = std::clamp(sample.percent, 0, 100);

        sample.gid = std::string(group(CAP_GID));
        sample.have_bytes = to_bytes(group(CAP_HAVE));
        sample.total_bytes = to_bytes(group(CAP_TOTAL));
        sample.speed = std::string(group(CAP_SPEED));
        sample.eta = std::string(trim(group(CAP_ETA)));
        return std::optional<ProgressSample>{std::move(sample)};
    } catch (const std::exception&) {
        // regex_error or bad_alloc: treat as an unparsable line
        return std::unexpected(make_error_code(TaskErrc::parse_error));
    }
}

bool ProgressParser::signals_completion(std::string_view line) noexcept {
    std::string lower;
    lower.reserve(line.size());
    for (char c : line) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return std::any_of(COMPLETION_PHRASES.begin(), COMPLETION_PHRASES.end(),
                       [&](std::string_view phrase) {
                           return lower.find(phrase) != std::string::npos;
                       });
}

} // namespace ariaflow::core
