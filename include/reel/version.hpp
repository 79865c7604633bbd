// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace reel {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
} version;

constexpr std::string_view APP_NAME = "Reel";
constexpr std::string_view BUILD_DATE = __DATE__;

} // namespace reel
