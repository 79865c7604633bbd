// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace reel::core {

constexpr std::chrono::milliseconds CHECKPOINT_POLL_INTERVAL{200};    // Bounded wait while paused
constexpr std::chrono::milliseconds CLEANUP_DELAY{500};               // Lets the filesystem settle
constexpr std::chrono::milliseconds RESULT_DISPLAY_DURATION{3000};    // Success/error shown this long
constexpr std::chrono::milliseconds UI_DISPATCH_INTERVAL{100};        // Per-field publish rate
constexpr std::chrono::milliseconds PROCESS_READ_TIMEOUT{200};        // Subprocess poll granularity
constexpr std::chrono::milliseconds PROCESS_TERMINATE_GRACE{2000};

constexpr std::size_t MAX_MESSAGE_LENGTH = 120;

constexpr std::uint64_t KIB = 1024;
constexpr std::uint64_t MIB = 1024 * KIB;
constexpr std::uint64_t GIB = 1024 * MIB;

constexpr std::string_view YTDLP_EXECUTABLE = "yt-dlp";
constexpr std::string_view DEFAULT_AUDIO_FORMAT = "mp3";
constexpr std::string_view DEFAULT_AUDIO_QUALITY = "192K";
constexpr std::string_view SETTINGS_FILE_NAME = "settings.json";

} // namespace reel::core
