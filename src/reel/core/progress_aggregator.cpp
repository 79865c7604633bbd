// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/progress_aggregator.hpp>
#include <reel/core/format.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <exception>

namespace reel::core {

ProgressAggregator::ProgressAggregator(UiDispatcher& dispatcher, std::chrono::milliseconds interval)
    : dispatcher_(dispatcher)
    , interval_(interval) {}

void ProgressAggregator::update(const RawProgressEvent& event) noexcept {
    try {
        Dirty dirty;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            apply(event, dirty);
        }

        if (dirty.stage) request_publish(Field::stage);
        if (dirty.item) request_publish(Field::item);
        if (dirty.progress) request_publish(Field::progress);
    } catch (const std::exception& e) {
        spdlog::error("Progress update dropped: {}", e.what());
    }
}

void ProgressAggregator::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    latest_ = ProgressSnapshot{};
    published_ = ProgressSnapshot{};
    pending_.fill(false);
    last_dispatch_.fill(std::chrono::steady_clock::time_point{});
    stream_index_ = 1;
    stream_total_ = 1;
}

ProgressSnapshot ProgressAggregator::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

ProgressSnapshot ProgressAggregator::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

//=============================================================================
// Event folding
//=============================================================================

void ProgressAggregator::apply(const RawProgressEvent& event, Dirty& dirty) {
    auto& s = latest_;

    auto set_stage = [&](Stage stage) {
        if (s.stage != stage) {
            s.stage = stage;
            dirty.stage = true;
        }
    };

    auto set_name = [&](const std::string& name) {
        if (!name.empty() && s.current_item_name != name) {
            s.current_item_name = name;
            dirty.item = true;
        }
    };

    // Item position can arrive on any event kind
    if (event.item_total && *event.item_total > 0 && s.item_total != *event.item_total) {
        s.item_total = *event.item_total;
        dirty.item = true;
    }
    if (event.item_index && *event.item_index > 0 && s.item_index != *event.item_index) {
        s.item_index = *event.item_index;
        dirty.item = true;
    }
    if (event.stream_total && *event.stream_total > 0) {
        stream_total_ = *event.stream_total;
    }
    if (event.stream_index && *event.stream_index > 0) {
        stream_index_ = *event.stream_index;
    }

    switch (event.kind) {
        case RawEventKind::resolving:
            set_stage(Stage::fetching_metadata);
            set_name(event.filename);
            break;

        case RawEventKind::item_total_known:
            break;

        case RawEventKind::downloading: {
            set_stage(Stage::downloading);
            set_name(event.filename);

            if (event.speed) {
                double speed = *event.speed;
                if (std::isfinite(speed) && speed >= 0.0) {
                    s.speed_bps = static_cast<std::uint64_t>(speed);
                    s.speed_text = format_speed(s.speed_bps);
                    dirty.progress = true;
                }
            } else if (s.speed_bps != 0 || !s.speed_text.empty()) {
                s.speed_bps = 0;
                s.speed_text.clear();
                dirty.progress = true;
            }

            apply_bytes(event.bytes_done, event.bytes_total.value_or(0), dirty);
            break;
        }

        case RawEventKind::finished: {
            set_stage(Stage::finishing);
            set_name(event.filename);
            std::uint64_t total = event.bytes_total.value_or(s.bytes_total);
            std::uint64_t done = total > 0 ? total : std::max(event.bytes_done, s.bytes_done);
            if (total == 0 && done > 0) {
                total = done;  // Item is whole, so its size is what was received
            }
            apply_bytes(done, total, dirty);
            break;
        }
    }
}

void ProgressAggregator::apply_bytes(std::uint64_t done, std::uint64_t total, Dirty& dirty) {
    auto& s = latest_;
    s.bytes_done = done;
    s.bytes_total = total;
    s.size_text = total > 0
        ? format_bytes(done) + " / " + format_bytes(total)
        : format_bytes(done);
    dirty.progress = true;

    if (total == 0) {
        return;  // Percent stays where it was
    }

    double fraction = std::min(static_cast<double>(done) / static_cast<double>(total), 1.0);
    if (stream_total_ > 1) {
        // Earlier streams of the item are complete
        auto stream = std::clamp<std::uint32_t>(stream_index_, 1, stream_total_);
        fraction = ((stream - 1) + fraction) / stream_total_;
    }

    double computed = fraction * 100.0;
    if (s.item_total > 1 && s.item_index >= 1) {
        auto index = std::min(s.item_index, s.item_total);
        computed = ((index - 1) + fraction) / s.item_total * 100.0;
    }

    computed = std::clamp(round_percent(computed), 0.0, 100.0);
    s.percent = std::max(s.percent, computed);
}

//=============================================================================
// Publishing
//=============================================================================

void ProgressAggregator::request_publish(Field field) {
    const auto index = static_cast<std::size_t>(field);
    std::chrono::milliseconds delay{0};
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_[index]) {
            return;  // The queued publish will pick up the new value
        }
        pending_[index] = true;
        generation = generation_;

        auto since = std::chrono::steady_clock::now() - last_dispatch_[index];
        if (since < interval_) {
            delay = std::chrono::ceil<std::chrono::milliseconds>(interval_ - since);
        }
    }

    std::weak_ptr<int> guard = alive_;
    try {
        dispatcher_.schedule([this, guard, field, generation] {
            if (guard.expired()) return;
            publish(field, generation);
        }, delay);
    } catch (...) {
        // Nothing was queued; the next update retries
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                pending_[index] = false;
            }
        }
        throw;
    }
}

void ProgressAggregator::publish(Field field, std::uint64_t generation) {
    ProgressSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }

        const auto index = static_cast<std::size_t>(field);
        pending_[index] = false;
        last_dispatch_[index] = std::chrono::steady_clock::now();

        switch (field) {
            case Field::progress:
                published_.percent = latest_.percent;
                published_.bytes_done = latest_.bytes_done;
                published_.bytes_total = latest_.bytes_total;
                published_.speed_bps = latest_.speed_bps;
                published_.size_text = latest_.size_text;
                published_.speed_text = latest_.speed_text;
                break;
            case Field::item:
                published_.current_item_name = latest_.current_item_name;
                published_.item_index = latest_.item_index;
                published_.item_total = latest_.item_total;
                break;
            case Field::stage:
                published_.stage = latest_.stage;
                break;
        }
        snapshot = published_;
    }

    if (listener_) {
        listener_(snapshot);
    }
}

} // namespace reel::core
