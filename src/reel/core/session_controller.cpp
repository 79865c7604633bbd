// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/session_controller.hpp>
#include <reel/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <system_error>

namespace reel::core {

namespace {

constexpr std::string_view SUCCESS_MESSAGE = "Download complete";

} // namespace

//=============================================================================
// WorkerObserver
//=============================================================================

class SessionController::WorkerObserver : public FetchObserver {
public:
    WorkerObserver(SessionController& controller, std::shared_ptr<Session> session)
        : controller_(controller)
        , session_(std::move(session))
        , gate_(session_->gate) {}

    CheckpointStatus report(const RawProgressEvent& event) override {
        if (checkpoint() == CheckpointStatus::cancelled) {
            return CheckpointStatus::cancelled;
        }
        if (event.kind == RawEventKind::downloading) {
            controller_.mark_active(*session_);
        }
        if (event.kind == RawEventKind::downloading || event.kind == RawEventKind::finished) {
            controller_.remember_artifact(*session_, event.filename);
        }
        controller_.aggregator_.update(event);
        return CheckpointStatus::proceed;
    }

    CheckpointStatus checkpoint() override {
        return gate_->wait(controller_.options_.checkpoint_poll);
    }

    bool pause_requested() const noexcept override {
        return !gate_->is_open();
    }

private:
    SessionController& controller_;
    std::shared_ptr<Session> session_;
    std::shared_ptr<PauseGate> gate_;
};

//=============================================================================
// SessionController
//=============================================================================

SessionController::SessionController(EngineAdapter& engine,
                                     UiDispatcher& dispatcher,
                                     StorageResolver& storage,
                                     CleanupService& cleanup,
                                     SessionOptions options)
    : engine_(engine)
    , dispatcher_(dispatcher)
    , storage_(storage)
    , cleanup_(cleanup)
    , options_(options)
    , aggregator_(dispatcher, options.dispatch_interval) {
    aggregator_.listener([this](const ProgressSnapshot& snapshot) {
        emit_snapshot(snapshot);
    });
}

SessionController::~SessionController() {
    cancel_and_join();
    if (worker_.joinable()) {
        worker_.join();
    }

    // Queued tasks become no-ops from here on
    alive_.reset();
}

bool SessionController::cancel_and_join() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || !is_busy(session_->state)) {
            return false;
        }
        session_->gate->request_cancel();
        session_->state = SessionState::cancelling;
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    return true;
}

std::optional<SessionInfo> SessionController::stop() {
    if (!cancel_and_join()) {
        return std::nullopt;
    }
    spdlog::info("Session stopped for shutdown");
    return current();
}

std::expected<SessionHandle, std::error_code>
SessionController::start(std::string_view url, MediaMode mode, QualityTier quality) {
    auto parsed = validate_media_url(url);
    if (!parsed) {
        spdlog::warn("Rejected start: {}", parsed.error().message());
        return std::unexpected(parsed.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && is_busy(session_->state)) {
            spdlog::warn("Rejected start: session {} is {}", session_->handle.id, to_string(session_->state));
            return std::unexpected(make_error_code(SessionErrc::busy));
        }
    }

    auto dir = storage_.output_dir(mode);
    if (!dir) {
        spdlog::warn("Rejected start: {}", dir.error().message());
        return std::unexpected(dir.error());
    }

    // The previous worker already finished its fetch; reap it before reusing the slot
    if (worker_.joinable()) {
        worker_.join();
    }

    auto session = std::make_shared<Session>();
    session->url = parsed->full();
    session->output_dir = std::move(*dir);
    session->mode = mode;
    session->quality = quality;

    std::shared_ptr<Session> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->handle.id = next_id_++;
        previous = std::exchange(session_, session);
    }
    aggregator_.reset();

    try {
        worker_ = std::jthread([this, session] { run_worker(session); });
    } catch (const std::system_error& e) {
        spdlog::error("Cannot spawn worker thread: {}", e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_ = std::move(previous);
        }
        return std::unexpected(make_error_code(SessionErrc::unexpected_error));
    }

    spdlog::info("Session {} started: {} ({}, {}) -> {}",
                 session->handle.id, session->url, to_string(mode),
                 to_string(quality), session->output_dir.string());

    emit_message({}, false);
    emit_state(session->handle.id);
    emit_snapshot(aggregator_.published());
    return session->handle;
}

void SessionController::pause() {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->state != SessionState::active) {
            return;
        }
        session_->gate->close();
        session_->state = SessionState::paused;
        id = session_->handle.id;
    }
    spdlog::debug("Session {} paused", id);
    emit_state(id);
}

void SessionController::resume() {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->state != SessionState::paused) {
            return;
        }
        session_->gate->open();
        session_->state = SessionState::active;
        id = session_->handle.id;
    }
    spdlog::debug("Session {} resumed", id);
    emit_state(id);
}

void SessionController::cancel() {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || !is_busy(session_->state) || session_->state == SessionState::cancelling) {
            return;
        }
        session_->gate->request_cancel();
        session_->state = SessionState::cancelling;
        id = session_->handle.id;
    }
    spdlog::info("Session {} cancelling", id);
    emit_state(id);
}

void SessionController::acknowledge() {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || !is_terminal(session_->state)) {
            return;
        }
        id = session_->handle.id;
        session_.reset();
    }
    spdlog::debug("Session {} acknowledged", id);
    emit_message({}, false);
    emit_state(id);
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ ? session_->state : SessionState::idle;
}

ProgressSnapshot SessionController::snapshot() const {
    return aggregator_.published();
}

std::optional<SessionInfo> SessionController::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }

    SessionInfo info;
    info.handle = session_->handle;
    info.state = session_->state;
    info.url = session_->url;
    info.output_dir = session_->output_dir;
    info.mode = session_->mode;
    info.quality = session_->quality;
    info.cancel_requested = session_->gate->cancel_requested();
    info.item_count = session_->item_count;
    info.error = session_->error;
    info.message = session_->message;
    info.artifact_stems = session_->artifact_stems;
    return info;
}

//=============================================================================
// Worker side
//=============================================================================

void SessionController::run_worker(std::shared_ptr<Session> session) noexcept {
    const auto id = session->handle.id;
    FetchResult result;

    FetchRequest request;
    request.url = session->url;
    request.output_dir = session->output_dir;
    request.mode = session->mode;
    request.quality = session->quality;

    try {
        WorkerObserver observer(*this, session);
        result = engine_.fetch(request, observer);
    } catch (const std::exception& e) {
        auto summary = exception_summary(e);
        spdlog::error("Session {} engine threw: {}", id, summary);
        result = FetchResult::failed(make_error_code(SessionErrc::unexpected_error), summary);
    } catch (...) {
        spdlog::error("Session {} engine threw a non-standard exception", id);
        result = FetchResult::failed(make_error_code(SessionErrc::unexpected_error), "unknown exception");
    }

    try {
        finish(*session, result);
        post([this, id] { on_worker_exited(id); });
    } catch (const std::exception& e) {
        spdlog::critical("Session {} lost its completion signal: {}", id, e.what());
        abandon(*session);
    }
}

// Settles a session whose exit can no longer reach the UI thread, so the
// slot is free for the next start()
void SessionController::abandon(Session& session) noexcept {
    try {
        std::filesystem::path dir;
        std::vector<std::string> stems;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (is_terminal(session.state)) {
                return;
            }
            if (session.state != SessionState::cancelling) {
                session.error = make_error_code(SessionErrc::unexpected_error);
                session.message = user_message(session.error, "session lost its completion signal");
                session.state = SessionState::failed;
                return;
            }
            if (session.cleanup_scheduled) {
                return;
            }
            session.cleanup_scheduled = true;
            dir = session.output_dir;
            stems = session.artifact_stems;
        }

        cleanup_.purge(dir, stems);

        std::lock_guard<std::mutex> lock(mutex_);
        session.state = SessionState::cancelled;
    } catch (const std::exception& e) {
        spdlog::critical("Session {} could not be settled: {}", session.handle.id, e.what());
    }
}

void SessionController::finish(Session& session, const FetchResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    session.item_count = result.item_count;

    if (session.gate->cancel_requested() || result.status == FetchStatus::cancelled) {
        // Cancel wins over whatever the engine reported
        session.gate->request_cancel();
        session.state = SessionState::cancelling;
        spdlog::debug("Session {} worker stopped after cancel", session.handle.id);
        return;
    }

    if (result.status == FetchStatus::completed) {
        session.state = SessionState::completed;
        session.message = std::string(SUCCESS_MESSAGE);
        spdlog::info("Session {} completed ({} item(s))", session.handle.id, result.item_count);
        return;
    }

    session.error = result.error ? result.error : make_error_code(SessionErrc::engine_failure);
    session.message = user_message(session.error, result.detail);
    session.state = SessionState::failed;
    spdlog::error("Session {} failed: {} [{}]", session.handle.id, session.error.message(), result.detail);
}

void SessionController::mark_active(Session& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session.state != SessionState::resolving) {
            return;
        }
        session.state = SessionState::active;
    }
    spdlog::debug("Session {} active", session.handle.id);
    const auto id = session.handle.id;
    post([this, id] { emit_state(id); });
}

void SessionController::remember_artifact(Session& session, std::string_view filename) {
    auto stem = CleanupService::artifact_stem(filename);
    if (stem.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stems = session.artifact_stems;
    if (std::find(stems.begin(), stems.end(), stem) == stems.end()) {
        stems.push_back(std::move(stem));
    }
}

//=============================================================================
// UI side
//=============================================================================

void SessionController::on_worker_exited(std::uint64_t id) {
    SessionState state;
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->handle.id != id) {
            return;  // Already replaced; start() reaped that worker
        }
        state = session_->state;
        message = session_->message;
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    switch (state) {
        case SessionState::cancelling:
            schedule_cleanup(id);
            break;

        case SessionState::completed:
            aggregator_.reset();
            emit_snapshot(aggregator_.published());
            emit_state(id);
            emit_message(message, false);
            if (notifier_) notifier_->finished(state, message);
            schedule_retire(id);
            break;

        case SessionState::failed:
            emit_state(id);
            emit_message(message, true);
            if (notifier_) notifier_->finished(state, message);
            schedule_retire(id);
            break;

        default:
            spdlog::error("Session {} worker exited in state {}", id, to_string(state));
            break;
    }
}

void SessionController::schedule_cleanup(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->handle.id != id || session_->cleanup_scheduled) {
            return;
        }
        session_->cleanup_scheduled = true;
    }
    post([this, id] { run_cleanup(id); }, options_.cleanup_delay);
}

void SessionController::run_cleanup(std::uint64_t id) {
    std::filesystem::path dir;
    std::vector<std::string> stems;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->handle.id != id) {
            return;
        }
        dir = session_->output_dir;
        stems = session_->artifact_stems;
    }

    try {
        cleanup_.purge(dir, stems);
    } catch (const std::exception& e) {
        spdlog::error("Cleanup of {} failed: {}", dir.string(), e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->handle.id != id) {
            return;
        }
        session_->state = SessionState::cancelled;
    }
    spdlog::info("Session {} cancelled", id);

    aggregator_.reset();
    emit_snapshot(aggregator_.published());
    emit_state(id);
    if (notifier_) notifier_->finished(SessionState::cancelled, {});
    schedule_retire(id);
}

void SessionController::schedule_retire(std::uint64_t id) {
    if (!options_.auto_acknowledge) {
        return;
    }
    post([this, id] { retire(id); }, options_.result_display);
}

void SessionController::retire(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->handle.id != id || !is_terminal(session_->state)) {
            return;
        }
    }
    acknowledge();
}

void SessionController::emit_state(std::uint64_t id) {
    SessionState state = SessionState::idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_) {
            if (session_->handle.id != id) {
                return;  // Stale notification for a replaced session
            }
            state = session_->state;
        }
    }

    auto emitted = std::make_pair(id, state);
    if (last_emitted_ == emitted) {
        return;
    }
    last_emitted_ = emitted;

    if (callbacks_.on_state) {
        callbacks_.on_state(SessionHandle{id}, state);
    }
}

void SessionController::emit_snapshot(const ProgressSnapshot& snapshot) {
    if (callbacks_.on_snapshot) {
        callbacks_.on_snapshot(snapshot);
    }
    if (notifier_) {
        notifier_->progress(snapshot);
    }
}

void SessionController::emit_message(std::string_view message, bool is_error) {
    if (callbacks_.on_message) {
        callbacks_.on_message(message, is_error);
    }
}

void SessionController::post(std::function<void()> fn, std::chrono::milliseconds delay) {
    std::weak_ptr<int> guard = alive_;
    dispatcher_.schedule([guard, fn = std::move(fn)] {
        if (guard.expired()) return;
        fn();
    }, delay);
}

} // namespace reel::core
