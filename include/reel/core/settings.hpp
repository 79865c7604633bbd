// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/session_controller.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace reel::core {

struct SettingsData {
    std::filesystem::path audio_dir;
    std::filesystem::path video_dir;
    std::string ytdlp_path;                 // Empty: search $PATH
    std::string audio_format{DEFAULT_AUDIO_FORMAT};
    std::string audio_quality{DEFAULT_AUDIO_QUALITY};
    std::chrono::milliseconds checkpoint_poll{CHECKPOINT_POLL_INTERVAL};
    std::chrono::milliseconds cleanup_delay{CLEANUP_DELAY};
    std::chrono::milliseconds result_display{RESULT_DISPLAY_DURATION};
    std::chrono::milliseconds dispatch_interval{UI_DISPATCH_INTERVAL};
    std::string log_level{"info"};

    // Built-in values with the platform media directories filled in
    [[nodiscard]] static SettingsData defaults();
};

// Process-wide settings, initialized exactly once.
//
// Call initialize() or load() before anything reads the settings; the first
// read otherwise locks in the defaults. Reads are safe from any thread once
// initialized.
class Settings {
public:
    static Settings& instance() noexcept {
        static Settings settings;
        return settings;
    }

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;
    Settings(Settings&&) = delete;
    Settings& operator=(Settings&&) = delete;

    // Errors: already_initialized.
    [[nodiscard]] std::error_code initialize(SettingsData data) noexcept;

    // Reads a JSON settings file. A missing file initializes with defaults.
    // Errors: invalid_settings (unreadable or malformed), already_initialized.
    [[nodiscard]] std::error_code load(const std::filesystem::path& file) noexcept;

    // Keys absent from `json` keep their default. Unknown keys are ignored.
    // Errors: invalid_settings.
    [[nodiscard]] static std::expected<SettingsData, std::error_code> parse(std::string_view json) noexcept;

    // $XDG_CONFIG_HOME/reel/settings.json, else ~/.config/reel/settings.json
    [[nodiscard]] static std::filesystem::path default_file();

    [[nodiscard]] bool initialized() const noexcept;
    [[nodiscard]] const SettingsData& data() noexcept;

    // Configured path if set, otherwise the first yt-dlp on $PATH.
    // Resolved once; later calls return the cached result.
    // Errors: tool_missing.
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code> ytdlp_executable() noexcept;

    [[nodiscard]] SessionOptions session_options() noexcept;

    // Searches $PATH for an executable named `name`
    [[nodiscard]] static std::optional<std::filesystem::path> find_in_path(std::string_view name);

private:
    Settings() = default;

    std::once_flag init_flag_;
    bool initialized_{false};
    SettingsData data_;

    std::once_flag tool_flag_;
    std::expected<std::filesystem::path, std::error_code> tool_{
        std::unexpected(make_error_code(SessionErrc::tool_missing))};
    mutable std::mutex mutex_;
};

} // namespace reel::core
