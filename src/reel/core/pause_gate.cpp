// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/pause_gate.hpp>

namespace reel::core {

void PauseGate::open() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
    }
    cv_.notify_all();
}

void PauseGate::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancel_requested_) {
        open_ = false;
    }
}

void PauseGate::request_cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
        open_ = true;
    }
    cv_.notify_all();
}

bool PauseGate::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

bool PauseGate::cancel_requested() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_requested_;
}

CheckpointStatus PauseGate::wait(std::chrono::milliseconds poll) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!open_ && !cancel_requested_) {
        cv_.wait_for(lock, poll);
    }
    return cancel_requested_ ? CheckpointStatus::cancelled : CheckpointStatus::proceed;
}

} // namespace reel::core
