// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::core {

// Removes partial artifacts an aborted fetch leaves in its output directory
class CleanupService {
public:
    virtual ~CleanupService() = default;

    // Deletes every partial artifact directly inside `dir` (no recursion).
    // A file that cannot be removed is logged and skipped.
    // Returns the number of files removed. A missing directory yields 0.
    std::size_t purge(const std::filesystem::path& dir);

    // Same, limited to artifacts named "<stem>.<...>" for one of `stems`.
    // An empty list removes nothing.
    virtual std::size_t purge(const std::filesystem::path& dir, const std::vector<std::string>& stems);

    // .part, .ytdl, .temp, .tmp, .part-Frag<N>[.part], and the per-stream
    // and merge files of a split download: <name>.f<N>.<ext>, <name>.temp.<ext>
    [[nodiscard]] static bool is_partial_artifact(std::string_view filename) noexcept;

    // Name an output file shares with its partial artifacts:
    // "Clip.f137.mp4.part" -> "Clip". Empty when nothing is left.
    [[nodiscard]] static std::string artifact_stem(std::string_view filename);

protected:
    virtual bool remove_file(const std::filesystem::path& path, std::error_code& ec);

private:
    std::size_t remove_matching(const std::filesystem::path& dir, const std::vector<std::string>* stems);
};

} // namespace reel::core
