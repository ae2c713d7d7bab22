// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string_view>

namespace ariaflow::core {

// Convert a human readable size token ("12.3MiB", "512KB", "934") to bytes.
// Binary multiples only: K=1024, M=1024^2, G=1024^3, T=1024^4.
// Empty or unparsable input yields 0.
[[nodiscard]] std::uint64_t to_bytes(std::string_view token) noexcept;

} // namespace ariaflow::core
