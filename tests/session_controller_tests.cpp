// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/session_controller.hpp>
#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace reel::core;
using namespace std::chrono_literals;

namespace {

constexpr auto WAIT = 5s;
constexpr const char* VIDEO_URL = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";

RawProgressEvent downloading(std::uint64_t done, std::uint64_t total) {
    RawProgressEvent event;
    event.kind = RawEventKind::downloading;
    event.bytes_done = done;
    event.bytes_total = total;
    event.filename = "Clip.mp4";
    return event;
}

// Engine whose behaviour is supplied by each test
class ScriptedEngine : public EngineAdapter {
public:
    using Script = std::function<FetchResult(const FetchRequest&, FetchObserver&)>;

    FetchResult fetch(const FetchRequest& request, FetchObserver& observer) override {
        ++calls;
        return script(request, observer);
    }

    Script script = [](const FetchRequest&, FetchObserver&) { return FetchResult::completed(); };
    std::atomic<int> calls{0};
};

class FixedStorage : public StorageResolver {
public:
    std::expected<std::filesystem::path, std::error_code> output_dir(MediaMode mode) override {
        if (failure) {
            return std::unexpected(*failure);
        }
        return std::filesystem::temp_directory_path() / (mode == MediaMode::audio ? "reel-audio" : "reel-video");
    }

    std::optional<std::error_code> failure;
};

class CountingCleanup : public CleanupService {
public:
    using CleanupService::purge;

    std::size_t purge(const std::filesystem::path& dir, const std::vector<std::string>& stems) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        last_dir = dir;
        last_stems = stems;
        return 0;
    }

    std::mutex mutex;
    int calls{0};
    std::filesystem::path last_dir;
    std::vector<std::string> last_stems;
};

// Forwards to the test's run loop; can turn away tasks posted from other threads
class GuardedDispatcher : public UiDispatcher {
public:
    explicit GuardedDispatcher(UiDispatcher& target) : target_(target) {}

    void schedule(UiTask task, std::chrono::milliseconds delay = std::chrono::milliseconds{0}) override {
        if (refuse_other_threads && std::this_thread::get_id() != owner_) {
            throw std::runtime_error("dispatcher closed");
        }
        target_.schedule(std::move(task), delay);
    }

    std::atomic<bool> refuse_other_threads{false};

private:
    UiDispatcher& target_;
    std::thread::id owner_{std::this_thread::get_id()};
};

class RecordingSink : public NotificationSink {
public:
    void progress(const ProgressSnapshot&) override { ++progress_calls; }
    void finished(SessionState outcome, std::string_view) override { outcomes.push_back(outcome); }

    int progress_calls{0};
    std::vector<SessionState> outcomes;
};

// Controller wired to a run loop pumped by the test thread
struct Harness {
    explicit Harness(bool auto_acknowledge = true) {
        SessionOptions options;
        options.checkpoint_poll = 5ms;
        options.cleanup_delay = 10ms;
        options.result_display = 30ms;
        options.dispatch_interval = 0ms;
        options.auto_acknowledge = auto_acknowledge;

        controller = std::make_unique<SessionController>(engine, dispatcher, storage, cleanup, options);

        SessionCallbacks callbacks;
        callbacks.on_state = [this](SessionHandle handle, SessionState state) {
            handles.push_back(handle);
            states.push_back(state);
        };
        callbacks.on_snapshot = [this](const ProgressSnapshot& snapshot) { snapshots.push_back(snapshot); };
        callbacks.on_message = [this](std::string_view text, bool is_error) {
            messages.emplace_back(std::string(text), is_error);
        };
        controller->callbacks(std::move(callbacks));
        controller->notifier(&sink);
    }

    bool wait_for(SessionState state, std::chrono::milliseconds timeout = WAIT) {
        return loop.run_until([&] { return !states.empty() && states.back() == state; }, timeout);
    }

    [[nodiscard]] int count(SessionState state) const {
        return static_cast<int>(std::count(states.begin(), states.end(), state));
    }

    void let_go() {
        std::call_once(released, [this] { release.set_value(); });
    }

    // Blocks the engine until let_go(), honouring pause and cancel meanwhile
    CheckpointStatus hold(FetchObserver& observer) {
        while (gate.wait_for(1ms) != std::future_status::ready) {
            if (observer.checkpoint() == CheckpointStatus::cancelled) {
                return CheckpointStatus::cancelled;
            }
        }
        return observer.checkpoint();
    }

    RunLoopDispatcher loop;
    GuardedDispatcher dispatcher{loop};
    ScriptedEngine engine;
    FixedStorage storage;
    CountingCleanup cleanup;
    RecordingSink sink;

    std::promise<void> release;
    std::shared_future<void> gate{release.get_future().share()};
    std::once_flag released;

    std::vector<SessionHandle> handles;
    std::vector<SessionState> states;
    std::vector<ProgressSnapshot> snapshots;
    std::vector<std::pair<std::string, bool>> messages;

    std::unique_ptr<SessionController> controller;
};

} // namespace

TEST_CASE("SessionController - start validation", "[session]") {
    Harness h;

    SECTION("Not a URL") {
        auto result = h.controller->start("not a url", MediaMode::video, QualityTier::max);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SessionErrc::invalid_url);
        CHECK(user_message(result.error()) == "Please enter a valid YouTube URL");
    }

    SECTION("Other site") {
        auto result = h.controller->start("https://example.com/v.mp4", MediaMode::video, QualityTier::max);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SessionErrc::unsupported_host);
    }

    SECTION("Storage unavailable") {
        h.storage.failure = make_error_code(SessionErrc::storage_unavailable);
        auto result = h.controller->start(VIDEO_URL, MediaMode::audio, QualityTier::max);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SessionErrc::storage_unavailable);
    }

    CHECK(h.controller->state() == SessionState::idle);
    CHECK_FALSE(h.controller->current().has_value());
    CHECK(h.states.empty());
    CHECK(h.engine.calls == 0);
}

TEST_CASE("SessionController - successful download", "[session]") {
    Harness h;
    FetchRequest seen;

    h.engine.script = [&](const FetchRequest& request, FetchObserver& observer) {
        seen = request;
        RawProgressEvent resolving;
        resolving.kind = RawEventKind::resolving;
        if (observer.report(resolving) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        if (observer.report(downloading(512'000, 1'048'576)) == CheckpointStatus::cancelled) {
            return FetchResult::cancelled();
        }
        if (h.hold(observer) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        RawProgressEvent done;
        done.kind = RawEventKind::finished;
        if (observer.report(done) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        return FetchResult::completed();
    };

    auto handle = h.controller->start("  https://youtu.be/dQw4w9WgXcQ ", MediaMode::audio, QualityTier::p720);
    REQUIRE(handle.has_value());
    CHECK(h.states.front() == SessionState::resolving);

    auto info = h.controller->current();
    REQUIRE(info.has_value());
    CHECK(info->handle == *handle);
    CHECK(info->url == "https://youtu.be/dQw4w9WgXcQ");
    CHECK(info->output_dir.filename().string() == "reel-audio");

    REQUIRE(h.wait_for(SessionState::active));
    REQUIRE(h.loop.run_until([&] { return h.controller->snapshot().percent > 0.0; }, WAIT));
    CHECK(h.controller->snapshot().percent == Catch::Approx(48.83));
    CHECK(h.controller->snapshot().size_text == "500.0 KB / 1.0 MB");

    h.let_go();
    REQUIRE(h.wait_for(SessionState::completed));

    CHECK(seen.url == "https://youtu.be/dQw4w9WgXcQ");
    CHECK(seen.mode == MediaMode::audio);
    CHECK(seen.quality == QualityTier::p720);

    REQUIRE_FALSE(h.messages.empty());
    CHECK(h.messages.back() == std::make_pair(std::string("Download complete"), false));
    CHECK(h.controller->snapshot().indeterminate());
    CHECK(h.cleanup.calls == 0);
    CHECK(h.sink.outcomes == std::vector<SessionState>{SessionState::completed});

    // Result is shown, then the controller returns to idle on its own
    REQUIRE(h.wait_for(SessionState::idle));
    CHECK(h.controller->state() == SessionState::idle);
    CHECK(h.messages.back().first.empty());
    CHECK(h.states == std::vector<SessionState>{
        SessionState::resolving, SessionState::active, SessionState::completed, SessionState::idle});
}

TEST_CASE("SessionController - only one session at a time", "[session]") {
    Harness h;
    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        if (observer.report(downloading(100, 1000)) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        if (h.hold(observer) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());

    SECTION("While resolving or active") {
        auto second = h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error() == SessionErrc::busy);

        REQUIRE(h.wait_for(SessionState::active));
        second = h.controller->start(VIDEO_URL, MediaMode::audio, QualityTier::max);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error() == SessionErrc::busy);
    }

    SECTION("While paused") {
        REQUIRE(h.wait_for(SessionState::active));
        h.controller->pause();
        REQUIRE(h.controller->state() == SessionState::paused);

        auto second = h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error() == SessionErrc::busy);
    }

    CHECK(h.engine.calls == 1);
    h.let_go();
    h.controller->resume();
    REQUIRE(h.wait_for(SessionState::completed));
}

TEST_CASE("SessionController - pause holds the worker and resume continues", "[session]") {
    Harness h;
    std::atomic<int> reported{0};

    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        for (int i = 1; i <= 200; ++i) {
            if (observer.report(downloading(static_cast<std::uint64_t>(i) * 5, 1000)) == CheckpointStatus::cancelled) {
                return FetchResult::cancelled();
            }
            reported = i;
            std::this_thread::sleep_for(2ms);
        }
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    REQUIRE(h.wait_for(SessionState::active));

    h.controller->pause();
    REQUIRE(h.states.back() == SessionState::paused);

    // Pause and resume are no-ops in the wrong state
    h.controller->pause();
    CHECK(h.count(SessionState::paused) == 1);

    h.loop.run_until([] { return false; }, 30ms);
    const int before = reported.load();
    h.loop.run_until([] { return false; }, 60ms);
    CHECK(reported.load() - before <= 1);
    CHECK(h.controller->state() == SessionState::paused);

    h.controller->resume();
    CHECK(h.states.back() == SessionState::active);

    REQUIRE(h.wait_for(SessionState::completed));
    CHECK(reported.load() == 200);

    // Progress seen by the UI never went backwards
    double last = -1.0;
    for (const auto& snapshot : h.snapshots) {
        if (snapshot.indeterminate()) continue;
        CHECK(snapshot.percent >= last);
        last = snapshot.percent;
    }
    CHECK(last == 100.0);
}

TEST_CASE("SessionController - cancel", "[session]") {
    Harness h;
    std::atomic<bool> engine_saw_cancel{false};

    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        if (observer.report(downloading(300, 1000)) == CheckpointStatus::cancelled) {
            engine_saw_cancel = true;
            return FetchResult::cancelled();
        }
        if (h.hold(observer) == CheckpointStatus::cancelled) {
            engine_saw_cancel = true;
            return FetchResult::cancelled();
        }
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    REQUIRE(h.wait_for(SessionState::active));

    SECTION("While paused") {
        h.controller->pause();
        REQUIRE(h.controller->state() == SessionState::paused);

        h.controller->cancel();
        CHECK(h.states.back() == SessionState::cancelling);
        CHECK(h.controller->current()->cancel_requested);

        // Pause and resume do nothing once cancelling
        h.controller->resume();
        h.controller->pause();
        CHECK(h.controller->state() == SessionState::cancelling);
    }

    SECTION("Twice behaves like once") {
        h.controller->cancel();
        h.controller->cancel();
        CHECK(h.count(SessionState::cancelling) == 1);
    }

    REQUIRE(h.wait_for(SessionState::cancelled));
    CHECK(engine_saw_cancel.load());
    CHECK(h.cleanup.calls == 1);
    CHECK(h.cleanup.last_dir.filename().string() == "reel-video");
    CHECK(h.cleanup.last_stems == std::vector<std::string>{"Clip"});
    CHECK(h.controller->snapshot().indeterminate());
    CHECK(h.sink.outcomes == std::vector<SessionState>{SessionState::cancelled});

    // Cancel after the fact is a no-op
    h.controller->cancel();
    CHECK(h.count(SessionState::cancelling) == 1);

    REQUIRE(h.wait_for(SessionState::idle));
    CHECK(h.cleanup.calls == 1);
}

TEST_CASE("SessionController - cancel wins over a late success", "[session]") {
    Harness h;
    h.engine.script = [&](const FetchRequest&, FetchObserver&) {
        // Ignores checkpoints entirely
        h.gate.wait();
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    CHECK(h.controller->state() == SessionState::resolving);

    h.controller->cancel();
    h.let_go();

    REQUIRE(h.wait_for(SessionState::cancelled));
    CHECK(h.count(SessionState::completed) == 0);
    CHECK(h.cleanup.calls == 1);

    // Nothing was written, so nothing is deleted
    CHECK(h.cleanup.last_stems.empty());
}

TEST_CASE("SessionController - files of a split download are remembered", "[session]") {
    Harness h;
    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        auto video = downloading(1000, 1000);
        video.filename = "Clip.f137.mp4";
        RawProgressEvent done;
        done.kind = RawEventKind::finished;
        done.filename = "Clip.f137.mp4";
        auto audio = downloading(10, 1000);
        audio.filename = "Clip.f140.m4a";
        for (const auto& event : {video, done, audio}) {
            if (observer.report(event) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        }
        if (h.hold(observer) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    REQUIRE(h.loop.run_until([&] {
        auto info = h.controller->current();
        return info && !info->artifact_stems.empty() && h.engine.calls == 1
            && h.controller->state() == SessionState::active;
    }, WAIT));

    h.controller->cancel();
    REQUIRE(h.wait_for(SessionState::cancelled));
    CHECK(h.cleanup.last_stems == std::vector<std::string>{"Clip"});
}

TEST_CASE("SessionController - stop for shutdown", "[session]") {
    Harness h;
    std::atomic<bool> engine_saw_cancel{false};
    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        if (observer.report(downloading(300, 1000)) == CheckpointStatus::cancelled ||
            h.hold(observer) == CheckpointStatus::cancelled) {
            engine_saw_cancel = true;
            return FetchResult::cancelled();
        }
        return FetchResult::completed();
    };

    SECTION("Nothing running") {
        CHECK_FALSE(h.controller->stop().has_value());
    }

    SECTION("Busy session is cancelled and joined") {
        REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
        REQUIRE(h.wait_for(SessionState::active));

        auto info = h.controller->stop();
        REQUIRE(info.has_value());
        CHECK(engine_saw_cancel.load());
        CHECK(info->state == SessionState::cancelling);
        CHECK(info->cancel_requested);
        CHECK(info->output_dir.filename().string() == "reel-video");
        CHECK(info->artifact_stems == std::vector<std::string>{"Clip"});

        // Deleting files is left to the caller
        h.controller.reset();
        h.loop.drain(200ms);
        CHECK(h.cleanup.calls == 0);
    }
}

TEST_CASE("SessionController - playlist size is shown before the first item", "[session]") {
    Harness h;
    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        RawProgressEvent total;
        total.kind = RawEventKind::item_total_known;
        total.item_total = 5;
        if (observer.report(total) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        if (h.hold(observer) == CheckpointStatus::cancelled) return FetchResult::cancelled();

        for (std::uint32_t item = 1; item <= 5; ++item) {
            auto event = downloading(1000, 1000);
            event.item_index = item;
            if (observer.report(event) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        }
        return FetchResult::completed(5);
    };

    REQUIRE(h.controller->start("https://www.youtube.com/playlist?list=PL123", MediaMode::audio,
                                QualityTier::max).has_value());

    REQUIRE(h.loop.run_until([&] {
        return !h.snapshots.empty() && h.snapshots.back().item_total == 5;
    }, WAIT));
    CHECK(h.controller->state() == SessionState::resolving);
    CHECK(h.snapshots.back().indeterminate());

    h.let_go();
    REQUIRE(h.wait_for(SessionState::completed));
    REQUIRE(h.controller->current().has_value());
    CHECK(h.controller->current()->item_count == 5);
}

TEST_CASE("SessionController - failures", "[session]") {
    Harness h(false);

    SECTION("Engine error is classified") {
        h.engine.script = [](const FetchRequest&, FetchObserver&) {
            const std::string detail = "ERROR: [youtube] abc: Private video";
            return FetchResult::failed(make_error_code(classify_engine_message(detail)), detail);
        };

        REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
        REQUIRE(h.wait_for(SessionState::failed));

        auto info = h.controller->current();
        REQUIRE(info.has_value());
        CHECK(info->error == SessionErrc::content_unavailable);
        CHECK(h.messages.back() == std::make_pair(std::string("This video is unavailable"), true));
    }

    SECTION("Unknown engine message") {
        h.engine.script = [](const FetchRequest&, FetchObserver&) {
            return FetchResult::failed(make_error_code(SessionErrc::engine_failure), "ERROR: odd");
        };

        REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
        REQUIRE(h.wait_for(SessionState::failed));
        CHECK(h.messages.back().first == "Failed to download: odd");
    }

    SECTION("Engine throws") {
        h.engine.script = [](const FetchRequest&, FetchObserver&) -> FetchResult {
            throw std::runtime_error("boom");
        };

        REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
        REQUIRE(h.wait_for(SessionState::failed));

        CHECK(h.controller->current()->error == SessionErrc::unexpected_error);
        CHECK(h.messages.back() == std::make_pair(std::string("Unexpected error: runtime error: boom"), true));
    }

    CHECK(h.cleanup.calls == 0);
    CHECK(h.sink.outcomes == std::vector<SessionState>{SessionState::failed});

    // Without auto acknowledge the result stays until acknowledged
    h.loop.run_until([] { return false; }, 60ms);
    CHECK(h.controller->state() == SessionState::failed);

    h.controller->acknowledge();
    CHECK(h.controller->state() == SessionState::idle);
    CHECK(h.states.back() == SessionState::idle);
}

TEST_CASE("SessionController - worker settles a session the UI thread cannot hear about", "[session]") {
    Harness h;
    h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
        if (h.hold(observer) == CheckpointStatus::cancelled) return FetchResult::cancelled();
        return FetchResult::completed();
    };

    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    h.dispatcher.refuse_other_threads = true;
    h.controller->cancel();

    REQUIRE(h.loop.run_until([&] { return h.controller->state() == SessionState::cancelled; }, WAIT));
    CHECK(h.cleanup.calls == 1);

    // The slot is free again
    h.dispatcher.refuse_other_threads = false;
    h.engine.script = [](const FetchRequest&, FetchObserver&) { return FetchResult::completed(); };
    REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
    REQUIRE(h.wait_for(SessionState::completed));
    CHECK(h.engine.calls == 2);
}

TEST_CASE("SessionController - new session after a terminal one", "[session]") {
    Harness h(false);
    h.engine.script = [](const FetchRequest&, FetchObserver&) {
        return FetchResult::failed(make_error_code(SessionErrc::no_matching_format));
    };

    auto first = h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::p360);
    REQUIRE(first.has_value());
    REQUIRE(h.wait_for(SessionState::failed));

    h.engine.script = [](const FetchRequest&, FetchObserver&) { return FetchResult::completed(); };
    auto second = h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max);
    REQUIRE(second.has_value());
    CHECK(*second != *first);

    REQUIRE(h.wait_for(SessionState::completed));
    CHECK(h.handles.back() == *second);
    CHECK(h.engine.calls == 2);
}

TEST_CASE("SessionController - destruction stops a running worker", "[session]") {
    std::atomic<bool> stopped{false};
    {
        Harness h;
        h.engine.script = [&](const FetchRequest&, FetchObserver& observer) {
            if (observer.report(downloading(1, 1000)) == CheckpointStatus::cancelled ||
                h.hold(observer) == CheckpointStatus::cancelled) {
                stopped = true;
                return FetchResult::cancelled();
            }
            return FetchResult::completed();
        };

        REQUIRE(h.controller->start(VIDEO_URL, MediaMode::video, QualityTier::max).has_value());
        REQUIRE(h.wait_for(SessionState::active));
        h.controller.reset();

        // Tasks queued by the worker must not reach the destroyed controller
        h.loop.drain(200ms);
    }
    CHECK(stopped.load());
}
