// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/units.hpp>
#include <charconv>
#include <cctype>
#include <limits>

namespace ariaflow::core {

namespace {

std::uint64_t unit_multiplier(char unit) noexcept {
    switch (std::toupper(static_cast<unsigned char>(unit))) {
        case 'K': return 1024ULL;
        case 'M': return 1024ULL * 1024;
        case 'G': return 1024ULL * 1024 * 1024;
        case 'T': return 1024ULL * 1024 * 1024 * 1024;
        default:  return 1;
    }
}

} // namespace

std::uint64_t to_bytes(std::string_view token) noexcept {
    std::size_t pos = 0;
    while (pos < token.size() && std::isspace(static_cast<unsigned char>(token[pos]))) {
        ++pos;
    }
    if (pos == token.size()) return 0;

    // No sign, no exponent: only digits and a decimal point
    const char first = token[pos];
    if (!std::isdigit(static_cast<unsigned char>(first)) && first != '.') {
        return 0;
    }

    double value = 0.0;
    const char* begin = token.data() + pos;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, std::chars_format::fixed);
    if (ec != std::errc{} || value < 0.0) {
        return 0;
    }

    // Optional whitespace, then K/M/G/T; a trailing "iB" or "B" carries no scale
    while (ptr != end && *ptr == ' ') {
        ++ptr;
    }
    std::uint64_t multiplier = 1;
    if (ptr != end) {
        multiplier = unit_multiplier(*ptr);
    }

    const double bytes = value * static_cast<double>(multiplier);
    if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(bytes);
}

} // namespace ariaflow::core
