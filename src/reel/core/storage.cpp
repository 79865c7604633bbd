// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/storage.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

fs::path home_subdir(const char* name) {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return fs::current_path() / name;
    }
    return fs::path(home) / name;
}

// Creates and removes a marker file
bool is_writable(const fs::path& dir) {
    auto marker = dir / ".reel-write-test";
    {
        std::ofstream out(marker, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
    }
    std::error_code ec;
    fs::remove(marker, ec);
    return true;
}

} // namespace

DirectoryStorage::DirectoryStorage(fs::path audio_dir, fs::path video_dir)
    : audio_dir_(std::move(audio_dir))
    , video_dir_(std::move(video_dir)) {}

std::expected<fs::path, std::error_code> DirectoryStorage::output_dir(MediaMode mode) {
    const fs::path& dir = mode == MediaMode::audio ? audio_dir_ : video_dir_;
    if (dir.empty()) {
        return std::unexpected(make_error_code(SessionErrc::storage_unavailable));
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory {}: {}", dir.string(), ec.message());
        return std::unexpected(make_error_code(SessionErrc::storage_unavailable));
    }

    if (!fs::is_directory(dir, ec) || !is_writable(dir)) {
        spdlog::error("Output directory {} is not writable", dir.string());
        return std::unexpected(make_error_code(SessionErrc::storage_unavailable));
    }

    return dir;
}

fs::path DirectoryStorage::default_audio_dir() {
    return home_subdir("Music");
}

fs::path DirectoryStorage::default_video_dir() {
    return home_subdir("Videos");
}

} // namespace reel::core
