// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/session.hpp>

namespace reel::core {

std::string_view to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::idle:       return "idle";
        case SessionState::resolving:  return "resolving";
        case SessionState::active:     return "active";
        case SessionState::paused:     return "paused";
        case SessionState::cancelling: return "cancelling";
        case SessionState::cancelled:  return "cancelled";
        case SessionState::completed:  return "completed";
        case SessionState::failed:     return "failed";
        default:                       return "unknown";
    }
}

std::string_view to_string(MediaMode m) noexcept {
    return m == MediaMode::audio ? "audio" : "video";
}

std::string_view to_string(QualityTier q) noexcept {
    switch (q) {
        case QualityTier::p1080: return "1080";
        case QualityTier::p720:  return "720";
        case QualityTier::p480:  return "480";
        case QualityTier::p360:  return "360";
        case QualityTier::max:
        default:                 return "max";
    }
}

std::string_view to_string(Stage s) noexcept {
    switch (s) {
        case Stage::fetching_metadata: return "fetching-metadata";
        case Stage::downloading:       return "downloading";
        case Stage::finishing:         return "finishing";
        default:                       return "unknown";
    }
}

std::optional<QualityTier> parse_quality(std::string_view text) noexcept {
    if (text == "max" || text == "best") return QualityTier::max;

    if (text.ends_with('p') || text.ends_with('P')) {
        text.remove_suffix(1);
    }

    if (text == "1080") return QualityTier::p1080;
    if (text == "720")  return QualityTier::p720;
    if (text == "480")  return QualityTier::p480;
    if (text == "360")  return QualityTier::p360;
    return std::nullopt;
}

} // namespace reel::core
