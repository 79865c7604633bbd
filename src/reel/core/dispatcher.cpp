// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/dispatcher.hpp>
#include <algorithm>
#include <vector>

namespace reel::core {

namespace {

// Upper bound on one idle wait so predicates changed by other threads are re-checked
constexpr std::chrono::milliseconds IDLE_WAKE{10};

} // namespace

void RunLoopDispatcher::schedule(UiTask task, std::chrono::milliseconds delay) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto due = clock::now() + std::max(delay, std::chrono::milliseconds{0});
        tasks_.emplace(Key{due, next_seq_++}, std::move(task));
    }
    cv_.notify_all();
}

std::size_t RunLoopDispatcher::run_pending() {
    std::size_t ran = 0;
    const auto now = clock::now();
    std::uint64_t seq_limit = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq_limit = next_seq_;
    }

    // Tasks scheduled while this pass runs wait for the next pass
    for (;;) {
        UiTask task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const auto& entry) {
                return entry.first.second < seq_limit;
            });
            if (it == tasks_.end() || it->first.first > now) {
                break;
            }
            task = std::move(it->second);
            tasks_.erase(it);
        }
        task();
        ++ran;
    }
    return ran;
}

bool RunLoopDispatcher::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    const auto deadline = clock::now() + timeout;
    for (;;) {
        run_pending();
        if (done()) {
            return true;
        }
        if (clock::now() >= deadline) {
            return false;
        }
        wait_for_work(deadline);
    }
}

bool RunLoopDispatcher::drain(std::chrono::milliseconds timeout) {
    return run_until([this] { return pending() == 0; }, timeout);
}

std::size_t RunLoopDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void RunLoopDispatcher::wait_for_work(clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto wake = std::min(deadline, clock::now() + IDLE_WAKE);
    if (!tasks_.empty()) {
        wake = std::min(wake, tasks_.begin()->first.first);
    }
    cv_.wait_until(lock, wake);
}

} // namespace reel::core
