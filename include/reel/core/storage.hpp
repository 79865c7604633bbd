// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/session.hpp>
#include <expected>
#include <filesystem>

namespace reel::core {

// Supplies the output directory for a session
class StorageResolver {
public:
    virtual ~StorageResolver() = default;

    // Returns an existing, writable directory for `mode`.
    // Errors: SessionErrc::storage_unavailable.
    virtual std::expected<std::filesystem::path, std::error_code> output_dir(MediaMode mode) = 0;
};

// Fixed audio and video directories, created on demand
class DirectoryStorage : public StorageResolver {
public:
    DirectoryStorage(std::filesystem::path audio_dir, std::filesystem::path video_dir);

    std::expected<std::filesystem::path, std::error_code> output_dir(MediaMode mode) override;

    [[nodiscard]] const std::filesystem::path& audio_dir() const noexcept { return audio_dir_; }
    [[nodiscard]] const std::filesystem::path& video_dir() const noexcept { return video_dir_; }

    // $HOME/Music and $HOME/Videos, falling back to the working directory
    [[nodiscard]] static std::filesystem::path default_audio_dir();
    [[nodiscard]] static std::filesystem::path default_video_dir();

private:
    std::filesystem::path audio_dir_;
    std::filesystem::path video_dir_;
};

} // namespace reel::core
