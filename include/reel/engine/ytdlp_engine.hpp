// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/engine.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::engine {

class Subprocess;

struct YtDlpOptions {
    std::string audio_format{core::DEFAULT_AUDIO_FORMAT};
    std::string audio_quality{core::DEFAULT_AUDIO_QUALITY};
    std::chrono::milliseconds read_timeout{core::PROCESS_READ_TIMEOUT};
    std::chrono::milliseconds terminate_grace{core::PROCESS_TERMINATE_GRACE};
};

// What the metadata pass learned about a URL
struct MediaMetadata {
    std::string title;
    bool playlist{false};
    std::uint32_t item_count{1};
    std::uint32_t stream_count{1};   // Separate downloads per item (video + audio = 2)
};

// Numbers the streams of each item as yt-dlp moves through them. A split
// video download fetches the video and then the audio of one item into
// separate files before merging.
class StreamTracker {
public:
    explicit StreamTracker(std::uint32_t streams_per_item = 1) noexcept
        : expected_(streams_per_item == 0 ? 1 : streams_per_item) {}

    // Sets stream_index and stream_total on a transfer event
    void apply(core::RawProgressEvent& event);

private:
    std::uint32_t expected_;
    std::uint32_t item_{0};
    std::uint32_t stream_{0};
    std::string file_;
};

// Engine adapter driving the yt-dlp executable.
//
// A fetch runs yt-dlp twice: once with -J to learn the title and playlist
// size, then for the transfer itself with a machine-readable progress
// template. The child is stopped while the session is paused and killed
// on cancel before fetch() returns.
class YtDlpEngine : public core::EngineAdapter {
public:
    using ExecutableResolver = std::function<std::expected<std::filesystem::path, std::error_code>()>;

    explicit YtDlpEngine(ExecutableResolver resolver, YtDlpOptions options = {});

    core::FetchResult fetch(const core::FetchRequest& request, core::FetchObserver& observer) override;

    [[nodiscard]] const YtDlpOptions& options() const noexcept { return options_; }

    // Tag that starts every line produced by the progress template
    static constexpr std::string_view PROGRESS_TAG = "reel-progress";

    [[nodiscard]] static std::vector<std::string> metadata_arguments(const core::FetchRequest& request);
    [[nodiscard]] static std::vector<std::string> download_arguments(const core::FetchRequest& request,
                                                                     const YtDlpOptions& options);

    // yt-dlp -f selector for a quality tier
    [[nodiscard]] static std::string format_selector(core::MediaMode mode, core::QualityTier quality);

    // Progress template output -> event. Other lines yield nullopt.
    [[nodiscard]] static std::optional<core::RawProgressEvent> parse_progress_line(std::string_view line);

    // Streams each item is expected to arrive in
    [[nodiscard]] static std::uint32_t streams_per_item(const MediaMetadata& metadata, core::MediaMode mode) noexcept;

    // -J output -> title, item count and stream count.
    // Errors: engine_failure.
    [[nodiscard]] static std::expected<MediaMetadata, std::error_code> parse_metadata(std::string_view json) noexcept;

private:
    using LineHandler = std::function<core::CheckpointStatus(std::string_view)>;

    struct RunOutcome {
        core::FetchStatus status{core::FetchStatus::completed};
        std::error_code error;
        std::string detail;
    };

    RunOutcome run(const std::filesystem::path& executable,
                   const std::vector<std::string>& args,
                   core::FetchObserver& observer,
                   const LineHandler& on_line);

    // Checkpoint with the child stopped while the gate is closed
    core::CheckpointStatus hold_if_paused(Subprocess& process, core::FetchObserver& observer);

    ExecutableResolver resolver_;
    YtDlpOptions options_;
};

} // namespace reel::engine
