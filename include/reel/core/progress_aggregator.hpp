// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/dispatcher.hpp>
#include <reel/core/engine.hpp>
#include <reel/core/session.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace reel::core {

// Turns raw engine samples into throttled ProgressSnapshot publishes.
//
// update() is called on the worker thread and never blocks on the UI.
// Each logical field group (progress, item, stage) has at most one publish
// queued on the dispatcher at a time, and is published at most once per
// interval. A queued publish always carries the newest value of its group.
// The listener is invoked on the UI thread only.
class ProgressAggregator {
public:
    using Listener = std::function<void(const ProgressSnapshot&)>;

    explicit ProgressAggregator(UiDispatcher& dispatcher,
                                std::chrono::milliseconds interval = UI_DISPATCH_INTERVAL);
    ~ProgressAggregator() = default;

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Set before the first update
    void listener(Listener l) noexcept { listener_ = std::move(l); }

    void update(const RawProgressEvent& event) noexcept;

    // Starts a fresh snapshot. Publishes queued for the old one are dropped.
    void reset() noexcept;

    // Most recent value seen from the worker, not yet necessarily published
    [[nodiscard]] ProgressSnapshot latest() const;

    // Value last handed to the listener
    [[nodiscard]] ProgressSnapshot published() const;

private:
    enum class Field : std::uint8_t { progress = 0, item = 1, stage = 2 };
    static constexpr std::size_t FIELD_COUNT = 3;

    struct Dirty {
        bool progress{false};
        bool item{false};
        bool stage{false};
    };

    void apply(const RawProgressEvent& event, Dirty& dirty);
    void apply_bytes(std::uint64_t done, std::uint64_t total, Dirty& dirty);

    // Decides under the lock whether `field` needs a dispatch; schedules outside
    void request_publish(Field field);
    void publish(Field field, std::uint64_t generation);

    UiDispatcher& dispatcher_;
    std::chrono::milliseconds interval_;
    Listener listener_;

    ProgressSnapshot latest_;
    ProgressSnapshot published_;
    std::array<bool, FIELD_COUNT> pending_{};
    std::array<std::chrono::steady_clock::time_point, FIELD_COUNT> last_dispatch_{};
    std::uint64_t generation_{0};
    std::uint32_t stream_index_{1};   // Position within the current item
    std::uint32_t stream_total_{1};
    mutable std::mutex mutex_;

    // Queued publishes hold a weak reference; they do nothing once this is gone
    std::shared_ptr<int> alive_{std::make_shared<int>(0)};
};

} // namespace reel::core
