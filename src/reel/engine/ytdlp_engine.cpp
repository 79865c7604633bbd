// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/engine/ytdlp_engine.hpp>
#include <reel/engine/subprocess.hpp>
#include <reel/core/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace reel::engine {

using core::CheckpointStatus;
using core::FetchResult;
using core::FetchStatus;
using core::RawEventKind;
using core::RawProgressEvent;
using core::SessionErrc;

namespace {

constexpr std::string_view PROGRESS_TEMPLATE =
    "download:reel-progress|%(progress.status)s|%(progress.downloaded_bytes)s"
    "|%(progress.total_bytes)s|%(progress.total_bytes_estimate)s|%(progress.speed)s"
    "|%(info.playlist_index)s|%(info.n_entries)s|%(progress.filename)s";

constexpr std::string_view OUTPUT_TEMPLATE = "%(title)s.%(ext)s";
constexpr std::string_view ERROR_PREFIX = "ERROR:";

// Splits off the next '|' separated field
std::string_view next_field(std::string_view& rest) noexcept {
    auto sep = rest.find('|');
    auto field = rest.substr(0, sep);
    rest = sep == std::string_view::npos ? std::string_view{} : rest.substr(sep + 1);
    return field;
}

// yt-dlp prints NA (or None) for fields it does not know
std::optional<double> parse_number(std::string_view text) noexcept {
    if (text.empty() || text == "NA" || text == "None") {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> parse_count(std::string_view text) noexcept {
    auto value = parse_number(text);
    if (!value || *value < 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::llround(*value));
}

std::optional<std::uint32_t> parse_index(std::string_view text) noexcept {
    auto value = parse_count(text);
    if (!value || *value == 0 || *value > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*value);
}

// Display name of the file being written: no directory, no .part suffix
std::string display_name(std::string_view path) {
    if (path.empty() || path == "NA") {
        return {};
    }
    auto name = std::filesystem::path(std::string(path)).filename().string();
    constexpr std::string_view part = ".part";
    if (name.size() > part.size() && name.ends_with(part)) {
        name.resize(name.size() - part.size());
    }
    return name;
}

} // namespace

YtDlpEngine::YtDlpEngine(ExecutableResolver resolver, YtDlpOptions options)
    : resolver_(std::move(resolver))
    , options_(std::move(options)) {}

//=============================================================================
// Fetch
//=============================================================================

FetchResult YtDlpEngine::fetch(const core::FetchRequest& request, core::FetchObserver& observer) {
    if (!resolver_) {
        return FetchResult::failed(make_error_code(SessionErrc::tool_missing), "no yt-dlp resolver configured");
    }
    auto executable = resolver_();
    if (!executable) {
        return FetchResult::failed(executable.error(), "yt-dlp executable not found");
    }

    RawProgressEvent resolving;
    resolving.kind = RawEventKind::resolving;
    if (observer.report(resolving) == CheckpointStatus::cancelled) {
        return FetchResult::cancelled();
    }

    // Phase 1: metadata
    std::string metadata_json;
    auto meta_run = run(*executable, metadata_arguments(request), observer,
        [&metadata_json](std::string_view line) {
            if (!line.empty() && line.front() == '{') {
                metadata_json.assign(line);
            }
            return CheckpointStatus::proceed;
        });

    if (meta_run.status == FetchStatus::cancelled) {
        return FetchResult::cancelled();
    }
    if (meta_run.status == FetchStatus::failed) {
        return FetchResult::failed(meta_run.error, meta_run.detail);
    }

    auto metadata = parse_metadata(metadata_json);
    if (!metadata) {
        return FetchResult::failed(metadata.error(), "yt-dlp returned unreadable metadata");
    }
    spdlog::info("Resolved '{}' ({} item(s))", metadata->title, metadata->item_count);

    RawProgressEvent titled;
    titled.kind = RawEventKind::resolving;
    titled.filename = metadata->title;
    if (observer.report(titled) == CheckpointStatus::cancelled) {
        return FetchResult::cancelled();
    }

    if (metadata->playlist) {
        RawProgressEvent total;
        total.kind = RawEventKind::item_total_known;
        total.item_total = metadata->item_count;
        if (observer.report(total) == CheckpointStatus::cancelled) {
            return FetchResult::cancelled();
        }
    }

    // Phase 2: transfer
    const auto item_count = metadata->item_count;
    const bool playlist = metadata->playlist;
    StreamTracker streams(streams_per_item(*metadata, request.mode));
    auto transfer = run(*executable, download_arguments(request, options_), observer,
        [&observer, &streams, item_count, playlist](std::string_view line) {
            auto event = parse_progress_line(line);
            if (!event) {
                return CheckpointStatus::proceed;
            }
            if (playlist && !event->item_total) {
                event->item_total = item_count;
            }
            streams.apply(*event);
            return observer.report(*event);
        });

    if (transfer.status == FetchStatus::cancelled) {
        return FetchResult::cancelled();
    }
    if (transfer.status == FetchStatus::failed) {
        return FetchResult::failed(transfer.error, transfer.detail);
    }
    return FetchResult::completed(item_count);
}

YtDlpEngine::RunOutcome YtDlpEngine::run(const std::filesystem::path& executable,
                                         const std::vector<std::string>& args,
                                         core::FetchObserver& observer,
                                         const LineHandler& on_line) {
    RunOutcome outcome;
    Subprocess process;

    if (auto ec = process.start(executable, args)) {
        outcome.status = FetchStatus::failed;
        outcome.error = ec;
        outcome.detail = ec.message();
        return outcome;
    }

    std::string line;
    for (;;) {
        auto status = process.read_line(line, options_.read_timeout);
        if (status == ReadStatus::eof) {
            break;
        }

        if (hold_if_paused(process, observer) == CheckpointStatus::cancelled) {
            process.terminate(options_.terminate_grace);
            outcome.status = FetchStatus::cancelled;
            return outcome;
        }

        if (status == ReadStatus::timeout) {
            continue;
        }

        if (line.starts_with(ERROR_PREFIX)) {
            spdlog::warn("yt-dlp: {}", line);
            outcome.detail = line;
        } else {
            spdlog::trace("yt-dlp: {}", line);
        }

        if (on_line(line) == CheckpointStatus::cancelled) {
            process.terminate(options_.terminate_grace);
            outcome.status = FetchStatus::cancelled;
            return outcome;
        }
    }

    auto exit_code = process.wait();
    if (!exit_code) {
        outcome.status = FetchStatus::failed;
        outcome.error = make_error_code(SessionErrc::unexpected_error);
        outcome.detail = exit_code.error().message();
        return outcome;
    }

    if (*exit_code != 0) {
        outcome.status = FetchStatus::failed;
        if (outcome.detail.empty()) {
            outcome.detail = "yt-dlp exited with code " + std::to_string(*exit_code);
        }
        outcome.error = make_error_code(core::classify_engine_message(outcome.detail));
        spdlog::error("yt-dlp exited with code {}: {}", *exit_code, outcome.detail);
    }
    return outcome;
}

CheckpointStatus YtDlpEngine::hold_if_paused(Subprocess& process, core::FetchObserver& observer) {
    if (!observer.pause_requested()) {
        return observer.checkpoint();
    }

    spdlog::debug("Stopping yt-dlp while paused");
    process.suspend();
    auto status = observer.checkpoint();
    process.resume();
    return status;
}

//=============================================================================
// Command lines
//=============================================================================

std::vector<std::string> YtDlpEngine::metadata_arguments(const core::FetchRequest& request) {
    return {
        "--flat-playlist", "-J", "--no-warnings",
        "-f", format_selector(request.mode, request.quality),
        "--", request.url,
    };
}

std::vector<std::string> YtDlpEngine::download_arguments(const core::FetchRequest& request,
                                                         const YtDlpOptions& options) {
    std::vector<std::string> args = {
        "--newline",
        "--no-colors",
        "--continue",
        "--progress-template", std::string(PROGRESS_TEMPLATE),
        "-o", (request.output_dir / std::string(OUTPUT_TEMPLATE)).string(),
        "-f", format_selector(request.mode, request.quality),
    };

    if (request.mode == core::MediaMode::audio) {
        args.insert(args.end(), {
            "-x",
            "--audio-format", options.audio_format,
            "--audio-quality", options.audio_quality,
        });
    }

    args.push_back("--");
    args.push_back(request.url);
    return args;
}

std::uint32_t YtDlpEngine::streams_per_item(const MediaMetadata& metadata, core::MediaMode mode) noexcept {
    if (!metadata.playlist) {
        return std::max<std::uint32_t>(metadata.stream_count, 1);
    }
    // Flat playlist entries carry no formats; assume the split the selector asks for
    return mode == core::MediaMode::audio ? 1 : 2;
}

std::string YtDlpEngine::format_selector(core::MediaMode mode, core::QualityTier quality) {
    if (mode == core::MediaMode::audio) {
        return "bestaudio/best";
    }

    auto height = core::max_height(quality);
    if (height == 0) {
        return "bestvideo+bestaudio/best";
    }

    auto limit = "[height<=" + std::to_string(height) + "]";
    return "bestvideo" + limit + "+bestaudio/best" + limit;
}

//=============================================================================
// Output parsing
//=============================================================================

std::optional<RawProgressEvent> YtDlpEngine::parse_progress_line(std::string_view line) {
    if (!line.starts_with(PROGRESS_TAG) || line.size() <= PROGRESS_TAG.size()
        || line[PROGRESS_TAG.size()] != '|') {
        return std::nullopt;
    }

    std::string_view rest = line.substr(PROGRESS_TAG.size() + 1);
    auto status = next_field(rest);
    auto downloaded = next_field(rest);
    auto total = next_field(rest);
    auto estimate = next_field(rest);
    auto speed = next_field(rest);
    auto index = next_field(rest);
    auto entries = next_field(rest);
    auto filename = rest;  // Last, may itself contain '|'

    RawProgressEvent event;
    if (status == "downloading") {
        event.kind = RawEventKind::downloading;
    } else if (status == "finished") {
        event.kind = RawEventKind::finished;
    } else {
        return std::nullopt;
    }

    event.bytes_done = parse_count(downloaded).value_or(0);
    event.bytes_total = parse_count(total);
    if (!event.bytes_total || *event.bytes_total == 0) {
        event.bytes_total = parse_count(estimate);
    }
    if (event.bytes_total && *event.bytes_total == 0) {
        event.bytes_total.reset();
    }
    event.speed = parse_number(speed);
    event.item_index = parse_index(index);
    event.item_total = parse_index(entries);
    event.filename = display_name(filename);
    return event;
}

std::expected<MediaMetadata, std::error_code> YtDlpEngine::parse_metadata(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(SessionErrc::engine_failure));
        }

        MediaMetadata meta;
        if (j.contains("title") && j["title"].is_string()) {
            meta.title = j["title"].get<std::string>();
        }

        if (j.contains("requested_formats") && j["requested_formats"].is_array()
            && !j["requested_formats"].empty()) {
            meta.stream_count = static_cast<std::uint32_t>(j["requested_formats"].size());
        }

        if (j.value("_type", std::string{}) == "playlist") {
            meta.playlist = true;
            if (j.contains("entries") && j["entries"].is_array()) {
                meta.item_count = static_cast<std::uint32_t>(j["entries"].size());
            } else if (j.contains("playlist_count") && j["playlist_count"].is_number_unsigned()) {
                meta.item_count = j["playlist_count"].get<std::uint32_t>();
            } else {
                meta.item_count = 0;
            }
        }

        return meta;
    } catch (const std::exception& e) {
        spdlog::error("Cannot parse yt-dlp metadata: {}", e.what());
        return std::unexpected(make_error_code(SessionErrc::engine_failure));
    }
}

//=============================================================================
// StreamTracker
//=============================================================================

void StreamTracker::apply(core::RawProgressEvent& event) {
    const auto item = event.item_index.value_or(1);
    if (item != item_) {
        item_ = item;
        stream_ = 1;
        file_ = event.filename;
    } else if (!event.filename.empty() && event.filename != file_) {
        if (!file_.empty()) {
            ++stream_;
        }
        file_ = event.filename;
    }

    event.stream_index = stream_;
    event.stream_total = std::max(expected_, stream_);
}

} // namespace reel::engine
