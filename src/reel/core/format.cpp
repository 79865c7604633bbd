// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/format.hpp>
#include <reel/core/config.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace reel::core {

std::string format_bytes(std::uint64_t bytes) {
    std::ostringstream ss;
    if (bytes >= GIB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GIB);
        return ss.str() + " GB";
    } else if (bytes >= MIB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MIB);
        return ss.str() + " MB";
    }
    ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / KIB);
    return ss.str() + " KB";
}

std::string format_speed(std::uint64_t bytes_per_second) {
    return format_bytes(bytes_per_second) + "/s";
}

std::string format_duration(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

double round_percent(double percent) noexcept {
    return std::round(percent * 100.0) / 100.0;
}

} // namespace reel::core
