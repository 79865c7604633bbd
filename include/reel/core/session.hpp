// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reel::core {

// Session state machine
enum class SessionState : std::uint8_t {
    idle,        // No session, or the last one was acknowledged
    resolving,   // Worker spawned, metadata not yet known
    active,      // Transferring
    paused,      // Gate closed by the user
    cancelling,  // Cancel requested, worker still unwinding
    cancelled,   // Worker gone, partial files purged
    completed,   // All items fetched
    failed       // Engine or unexpected failure
};

enum class MediaMode : std::uint8_t {
    audio,
    video
};

enum class QualityTier : std::uint8_t {
    max,
    p1080,
    p720,
    p480,
    p360
};

enum class Stage : std::uint8_t {
    fetching_metadata,
    downloading,
    finishing
};

// Latest known state of an in-flight fetch. Replaced as a whole on update.
struct ProgressSnapshot {
    double percent{-1.0};               // 0-100, -1 = indeterminate
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};       // 0 = unknown
    std::uint64_t speed_bps{0};
    std::string current_item_name;
    Stage stage{Stage::fetching_metadata};
    std::uint32_t item_index{0};        // 1-based once known
    std::uint32_t item_total{0};        // 0 = unknown
    std::string size_text;              // "500.0 KB / 1.0 MB"
    std::string speed_text;             // "1.2 MB/s"

    [[nodiscard]] bool indeterminate() const noexcept { return percent < 0.0; }
};

struct SessionHandle {
    std::uint64_t id{0};

    constexpr auto operator<=>(const SessionHandle&) const = default;
};

[[nodiscard]] constexpr bool is_terminal(SessionState s) noexcept {
    return s == SessionState::cancelled
        || s == SessionState::completed
        || s == SessionState::failed;
}

// Non-terminal and not idle: blocks a new Start
[[nodiscard]] constexpr bool is_busy(SessionState s) noexcept {
    return s != SessionState::idle && !is_terminal(s);
}

[[nodiscard]] std::string_view to_string(SessionState s) noexcept;
[[nodiscard]] std::string_view to_string(MediaMode m) noexcept;
[[nodiscard]] std::string_view to_string(QualityTier q) noexcept;
[[nodiscard]] std::string_view to_string(Stage s) noexcept;

// Accepts "max"/"best", "1080", "720", "480", "360" (an optional trailing 'p' is allowed)
[[nodiscard]] std::optional<QualityTier> parse_quality(std::string_view text) noexcept;

// Height limit for a tier, 0 for max
[[nodiscard]] constexpr std::uint32_t max_height(QualityTier q) noexcept {
    switch (q) {
        case QualityTier::p1080: return 1080;
        case QualityTier::p720:  return 720;
        case QualityTier::p480:  return 480;
        case QualityTier::p360:  return 360;
        case QualityTier::max:
        default:                 return 0;
    }
}

} // namespace reel::core
