// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/pause_gate.hpp>
#include <reel/core/session.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace reel::core {

enum class RawEventKind : std::uint8_t {
    resolving,         // Metadata lookup started or title known
    downloading,       // Byte progress of the current item
    finished,          // Current item transferred, post-processing
    item_total_known   // Playlist size known
};

// One progress sample as produced by the engine
struct RawProgressEvent {
    RawEventKind kind{RawEventKind::downloading};
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> bytes_total;
    std::optional<double> speed;                // bytes per second
    std::string filename;
    std::optional<std::uint32_t> item_index;    // 1-based
    std::optional<std::uint32_t> item_total;
    std::optional<std::uint32_t> stream_index;  // 1-based, within the item
    std::optional<std::uint32_t> stream_total;  // Files one item is fetched as
};

struct FetchRequest {
    std::string url;
    std::filesystem::path output_dir;
    MediaMode mode{MediaMode::video};
    QualityTier quality{QualityTier::max};
};

enum class FetchStatus : std::uint8_t {
    completed,
    cancelled,
    failed
};

struct FetchResult {
    FetchStatus status{FetchStatus::completed};
    std::uint32_t item_count{0};
    std::error_code error;
    std::string detail;      // Raw engine message on failure

    static FetchResult completed(std::uint32_t items = 1) {
        return {FetchStatus::completed, items, {}, {}};
    }

    static FetchResult cancelled() {
        return {FetchStatus::cancelled, 0, make_error_code(SessionErrc::cancelled), {}};
    }

    static FetchResult failed(std::error_code ec, std::string detail = {}) {
        return {FetchStatus::failed, 0, ec, std::move(detail)};
    }
};

// Worker-side view of the session, handed to the engine for the duration
// of one fetch. Every method is called on the worker thread.
class FetchObserver {
public:
    virtual ~FetchObserver() = default;

    // Checkpoint, then forward `event` to progress tracking. Returns
    // cancelled without forwarding once a cancel was requested.
    virtual CheckpointStatus report(const RawProgressEvent& event) = 0;

    // Blocks while paused. Must be reached at least once per progress tick.
    virtual CheckpointStatus checkpoint() = 0;

    // True while the user wants the fetch held. Lets an engine suspend
    // external work before blocking in checkpoint().
    [[nodiscard]] virtual bool pause_requested() const noexcept = 0;
};

// Performs the actual fetch, synchronously on the worker thread
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual FetchResult fetch(const FetchRequest& request, FetchObserver& observer) = 0;
};

} // namespace reel::core
