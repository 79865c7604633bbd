// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/cleanup_service.hpp>
#include <reel/core/config.hpp>
#include <reel/core/dispatcher.hpp>
#include <reel/core/engine.hpp>
#include <reel/core/error.hpp>
#include <reel/core/notification.hpp>
#include <reel/core/pause_gate.hpp>
#include <reel/core/progress_aggregator.hpp>
#include <reel/core/session.hpp>
#include <reel/core/storage.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace reel::core {

// Controller timings
struct SessionOptions {
    std::chrono::milliseconds checkpoint_poll{CHECKPOINT_POLL_INTERVAL};
    std::chrono::milliseconds cleanup_delay{CLEANUP_DELAY};
    std::chrono::milliseconds result_display{RESULT_DISPLAY_DURATION};
    std::chrono::milliseconds dispatch_interval{UI_DISPATCH_INTERVAL};
    bool auto_acknowledge{true};   // Return to idle after result_display
};

// UI-thread observers. Any of them may be left empty.
struct SessionCallbacks {
    std::function<void(SessionHandle, SessionState)> on_state;
    std::function<void(const ProgressSnapshot&)> on_snapshot;
    std::function<void(std::string_view message, bool is_error)> on_message;
};

// Read-only view of the current session
struct SessionInfo {
    SessionHandle handle;
    SessionState state{SessionState::idle};
    std::string url;
    std::filesystem::path output_dir;
    MediaMode mode{MediaMode::video};
    QualityTier quality{QualityTier::max};
    bool cancel_requested{false};
    std::uint32_t item_count{0};
    std::error_code error;
    std::string message;
    std::vector<std::string> artifact_stems;   // Output names the engine reported
};

// Owns the one-session-at-a-time state machine.
//
// start/pause/resume/cancel/acknowledge must be called on the UI thread,
// the same thread that runs the dispatcher's tasks. The getters are safe
// from any thread. Exactly one worker thread exists per running session;
// it is the only thread that calls into the engine.
class SessionController {
public:
    SessionController(EngineAdapter& engine,
                      UiDispatcher& dispatcher,
                      StorageResolver& storage,
                      CleanupService& cleanup,
                      SessionOptions options = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;
    SessionController(SessionController&&) = delete;
    SessionController& operator=(SessionController&&) = delete;

    // Set before the first start()
    void callbacks(SessionCallbacks cb) noexcept { callbacks_ = std::move(cb); }
    void notifier(NotificationSink* sink) noexcept { notifier_ = sink; }

    // Validates `url`, claims the single session slot and spawns the worker.
    // Errors: invalid_url, unsupported_host, busy, storage_unavailable,
    // unexpected_error (thread could not be created).
    [[nodiscard]] std::expected<SessionHandle, std::error_code>
    start(std::string_view url, MediaMode mode, QualityTier quality);

    // Active -> Paused. No-op otherwise.
    void pause();

    // Paused -> Active. No-op otherwise.
    void resume();

    // Resolving/Active/Paused -> Cancelling, then Cancelled once the worker
    // has exited and partial files were purged. No-op otherwise.
    void cancel();

    // Terminal -> Idle. No-op otherwise.
    void acknowledge();

    // Cancels a busy session and joins its worker right away, leaving the
    // purge to the caller. Returns the stopped session, or nullopt if none
    // was busy. For shutdown, when the dispatcher will not run again.
    std::optional<SessionInfo> stop();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] ProgressSnapshot snapshot() const;
    [[nodiscard]] std::optional<SessionInfo> current() const;
    [[nodiscard]] const SessionOptions& options() const noexcept { return options_; }

private:
    struct Session {
        SessionHandle handle;
        std::string url;
        std::filesystem::path output_dir;
        MediaMode mode{MediaMode::video};
        QualityTier quality{QualityTier::max};
        SessionState state{SessionState::resolving};
        std::shared_ptr<PauseGate> gate{std::make_shared<PauseGate>()};
        bool cleanup_scheduled{false};
        std::uint32_t item_count{0};
        std::error_code error;
        std::string message;
        std::vector<std::string> artifact_stems;
    };

    class WorkerObserver;

    // Worker thread
    void run_worker(std::shared_ptr<Session> session) noexcept;
    void finish(Session& session, const FetchResult& result);
    void mark_active(Session& session);
    void remember_artifact(Session& session, std::string_view filename);
    void abandon(Session& session) noexcept;

    // Requests cancel of a busy session and joins the worker. Returns true if one was busy.
    bool cancel_and_join() noexcept;

    // UI thread
    void on_worker_exited(std::uint64_t id);
    void schedule_cleanup(std::uint64_t id);
    void run_cleanup(std::uint64_t id);
    void schedule_retire(std::uint64_t id);
    void retire(std::uint64_t id);
    void emit_state(std::uint64_t id);
    void emit_snapshot(const ProgressSnapshot& snapshot);
    void emit_message(std::string_view message, bool is_error);

    // Runs `fn` on the UI thread unless the controller is gone by then
    void post(std::function<void()> fn, std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    EngineAdapter& engine_;
    UiDispatcher& dispatcher_;
    StorageResolver& storage_;
    CleanupService& cleanup_;
    SessionOptions options_;
    ProgressAggregator aggregator_;

    SessionCallbacks callbacks_;
    NotificationSink* notifier_{nullptr};

    std::shared_ptr<Session> session_;
    std::uint64_t next_id_{1};
    mutable std::mutex mutex_;

    // UI thread only
    std::jthread worker_;
    std::optional<std::pair<std::uint64_t, SessionState>> last_emitted_;

    std::shared_ptr<int> alive_{std::make_shared<int>(0)};
};

} // namespace reel::core
