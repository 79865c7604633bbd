// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/settings.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/storage.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        spdlog::error("Setting '{}' must be a string", key);
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_path(const nlohmann::json& j, const char* key, fs::path& out) {
    std::string value;
    if (!j.contains(key)) return true;
    if (!read_string(j, key, value)) return false;
    if (!value.empty()) {
        out = value;
    }
    return true;
}

bool read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out, bool allow_zero) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        spdlog::error("Setting '{}' must be an integer number of milliseconds", key);
        return false;
    }
    auto ms = v.get<std::int64_t>();
    if (ms < 0 || (ms == 0 && !allow_zero)) {
        spdlog::error("Setting '{}' is out of range: {}", key, ms);
        return false;
    }
    out = std::chrono::milliseconds{ms};
    return true;
}

bool is_executable(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return false;
    }
    constexpr auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (status.permissions() & exec_bits) != fs::perms::none;
}

} // namespace

//=============================================================================
// SettingsData
//=============================================================================

SettingsData SettingsData::defaults() {
    SettingsData data;
    data.audio_dir = DirectoryStorage::default_audio_dir();
    data.video_dir = DirectoryStorage::default_video_dir();
    return data;
}

//=============================================================================
// Settings
//=============================================================================

std::error_code Settings::initialize(SettingsData data) noexcept {
    bool applied = false;
    std::call_once(init_flag_, [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::move(data);
        initialized_ = true;
        applied = true;
    });

    if (!applied) {
        spdlog::warn("Settings already initialized, ignoring new values");
        return make_error_code(SessionErrc::already_initialized);
    }
    return {};
}

std::error_code Settings::load(const fs::path& file) noexcept {
    if (initialized()) {
        return make_error_code(SessionErrc::already_initialized);
    }

    try {
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            spdlog::info("No settings file at {}, using defaults", file.string());
            return initialize(SettingsData::defaults());
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            spdlog::error("Cannot read settings file {}", file.string());
            return make_error_code(SessionErrc::invalid_settings);
        }

        std::ostringstream contents;
        contents << in.rdbuf();

        auto parsed = parse(contents.str());
        if (!parsed) {
            spdlog::error("Invalid settings file {}", file.string());
            return parsed.error();
        }

        spdlog::debug("Loaded settings from {}", file.string());
        return initialize(std::move(*parsed));
    } catch (const std::exception& e) {
        spdlog::error("Failed to load settings from {}: {}", file.string(), e.what());
        return make_error_code(SessionErrc::invalid_settings);
    }
}

std::expected<SettingsData, std::error_code> Settings::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(SessionErrc::invalid_settings));
        }

        auto data = SettingsData::defaults();

        bool ok = read_path(j, "audio_dir", data.audio_dir)
               && read_path(j, "video_dir", data.video_dir)
               && read_string(j, "ytdlp_path", data.ytdlp_path)
               && read_string(j, "audio_format", data.audio_format)
               && read_string(j, "audio_quality", data.audio_quality)
               && read_millis(j, "checkpoint_poll_ms", data.checkpoint_poll, false)
               && read_millis(j, "cleanup_delay_ms", data.cleanup_delay, true)
               && read_millis(j, "result_display_ms", data.result_display, true)
               && read_millis(j, "dispatch_interval_ms", data.dispatch_interval, true)
               && read_string(j, "log_level", data.log_level);
        if (!ok) {
            return std::unexpected(make_error_code(SessionErrc::invalid_settings));
        }

        if (data.audio_format.empty() || data.audio_quality.empty()) {
            spdlog::error("Audio format and quality must not be empty");
            return std::unexpected(make_error_code(SessionErrc::invalid_settings));
        }

        if (!parse_log_level(data.log_level)) {
            spdlog::error("Unknown log level '{}'", data.log_level);
            return std::unexpected(make_error_code(SessionErrc::invalid_settings));
        }

        return data;
    } catch (const std::exception& e) {
        spdlog::error("Settings parse error: {}", e.what());
        return std::unexpected(make_error_code(SessionErrc::invalid_settings));
    }
}

fs::path Settings::default_file() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "reel" / SETTINGS_FILE_NAME;
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return fs::path(home) / ".config" / "reel" / SETTINGS_FILE_NAME;
    }
    return fs::path(SETTINGS_FILE_NAME);
}

bool Settings::initialized() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

const SettingsData& Settings::data() noexcept {
    std::call_once(init_flag_, [this] {
        auto defaults = SettingsData::defaults();
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::move(defaults);
        initialized_ = true;
    });
    return data_;
}

std::expected<fs::path, std::error_code> Settings::ytdlp_executable() noexcept {
    const auto& configured = data().ytdlp_path;

    std::call_once(tool_flag_, [&] {
        std::optional<fs::path> found;
        try {
            if (configured.empty()) {
                found = find_in_path(YTDLP_EXECUTABLE);
            } else if (configured.find('/') != std::string::npos) {
                if (is_executable(configured)) {
                    found = fs::path(configured);
                }
            } else {
                found = find_in_path(configured);
            }
        } catch (const std::exception& e) {
            spdlog::error("yt-dlp lookup failed: {}", e.what());
        }

        if (found) {
            spdlog::debug("Using yt-dlp at {}", found->string());
            tool_ = *found;
        } else {
            spdlog::error("yt-dlp not found (ytdlp_path = '{}')", configured);
        }
    });

    return tool_;
}

SessionOptions Settings::session_options() noexcept {
    const auto& d = data();
    SessionOptions options;
    options.checkpoint_poll = d.checkpoint_poll;
    options.cleanup_delay = d.cleanup_delay;
    options.result_display = d.result_display;
    options.dispatch_interval = d.dispatch_interval;
    return options;
}

std::optional<fs::path> Settings::find_in_path(std::string_view name) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    std::string_view dirs(path_env);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);

        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = fs::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace reel::core
