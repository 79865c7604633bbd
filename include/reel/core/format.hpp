// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace reel::core {

// KB with one decimal below 1 MiB, MB with one decimal below 1 GiB,
// GB with two decimals above. 0 -> "0.0 KB", 1048576 -> "1.0 MB".
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// format_bytes + "/s"
[[nodiscard]] std::string format_speed(std::uint64_t bytes_per_second);

// "1h 02m 5s", "3m 10s", "42s"
[[nodiscard]] std::string format_duration(std::uint64_t seconds);

// Rounds half away from zero to two decimals
[[nodiscard]] double round_percent(double percent) noexcept;

} // namespace reel::core
