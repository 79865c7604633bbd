// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace reel::core {

enum class CheckpointStatus : std::uint8_t {
    proceed,
    cancelled
};

// Pause gate and cancel flag of one session.
// Written from the UI thread, waited on by the worker.
class PauseGate {
public:
    PauseGate() = default;

    PauseGate(const PauseGate&) = delete;
    PauseGate& operator=(const PauseGate&) = delete;

    void open() noexcept;
    void close() noexcept;

    // One-way. Also opens the gate so a blocked worker wakes up.
    void request_cancel() noexcept;

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] bool cancel_requested() const noexcept;

    // Blocks while the gate is closed. Returns cancelled as soon as a cancel
    // was requested, whether or not the caller was blocked. `poll` bounds each
    // individual wait.
    [[nodiscard]] CheckpointStatus wait(std::chrono::milliseconds poll) noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{true};
    bool cancel_requested_{false};
};

} // namespace reel::core
