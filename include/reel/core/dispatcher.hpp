// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace reel::core {

using UiTask = std::function<void()>;

// Marshals work onto the thread that owns the user interface
class UiDispatcher {
public:
    virtual ~UiDispatcher() = default;

    // Thread-safe. Runs `task` on the UI thread no earlier than `delay` from now.
    virtual void schedule(UiTask task, std::chrono::milliseconds delay = std::chrono::milliseconds{0}) = 0;
};

// Timed task queue pumped by whichever thread owns it.
// Tasks due at the same time run in scheduling order.
class RunLoopDispatcher : public UiDispatcher {
public:
    using clock = std::chrono::steady_clock;

    RunLoopDispatcher() = default;

    RunLoopDispatcher(const RunLoopDispatcher&) = delete;
    RunLoopDispatcher& operator=(const RunLoopDispatcher&) = delete;

    void schedule(UiTask task, std::chrono::milliseconds delay = std::chrono::milliseconds{0}) override;

    // Runs every task that is due. Returns the number run.
    std::size_t run_pending();

    // Pumps until `done()` holds or `timeout` elapses. Returns done().
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    // Pumps until the queue is empty (delayed tasks included) or `timeout` elapses
    bool drain(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t pending() const;

private:
    using Key = std::pair<clock::time_point, std::uint64_t>;

    // Blocks until the next task is due, something is scheduled, or `deadline`
    void wait_for_work(clock::time_point deadline);

    std::map<Key, UiTask> tasks_;
    std::uint64_t next_seq_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace reel::core
