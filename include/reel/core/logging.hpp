// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/common.h>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>

namespace reel::core {

constexpr std::string_view LOGGER_NAME = "reel";

// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) noexcept;

// Installs the default "reel" logger: colored stderr, plus `file` when given.
// Safe to call again; the previous default logger is replaced.
// Errors: invalid_settings (unknown level), std::errc::io_error (file sink).
[[nodiscard]] std::error_code init_logging(std::string_view level,
                                           const std::filesystem::path& file = {}) noexcept;

} // namespace reel::core
