// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/cleanup_service.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 4> PARTIAL_SUFFIXES = {
    ".part",
    ".ytdl",
    ".temp",
    ".tmp",
};

constexpr std::string_view FRAGMENT_MARKER = ".part-Frag";
constexpr std::string_view MERGE_TAG = ".temp";

bool all_digits(std::string_view text) noexcept {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// ".part-Frag" followed by at least one digit
bool has_fragment_marker(std::string_view name) noexcept {
    auto pos = name.find(FRAGMENT_MARKER);
    while (pos != std::string_view::npos) {
        auto after = pos + FRAGMENT_MARKER.size();
        if (after < name.size() && std::isdigit(static_cast<unsigned char>(name[after]))) {
            return true;
        }
        pos = name.find(FRAGMENT_MARKER, pos + 1);
    }
    return false;
}

// "f137": the format id yt-dlp puts before the extension of a single stream
bool is_format_tag(std::string_view tag) noexcept {
    return tag.size() > 1 && tag.front() == 'f' && all_digits(tag.substr(1));
}

// Drops a trailing ".<tag>" that satisfies `pred`. Returns true if it did.
template <typename Pred>
bool drop_component(std::string_view& name, Pred pred) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || !pred(name.substr(dot + 1))) {
        return false;
    }
    name = name.substr(0, dot);
    return true;
}

bool drop_partial_suffix(std::string_view& name) noexcept {
    for (auto suffix : PARTIAL_SUFFIXES) {
        if (name.size() > suffix.size() && name.ends_with(suffix)) {
            name.remove_suffix(suffix.size());
            return true;
        }
    }
    auto frag = name.rfind(FRAGMENT_MARKER);
    if (frag != std::string_view::npos && frag > 0
        && all_digits(name.substr(frag + FRAGMENT_MARKER.size()))) {
        name = name.substr(0, frag);
        return true;
    }
    return false;
}

} // namespace

bool CleanupService::is_partial_artifact(std::string_view filename) noexcept {
    for (auto suffix : PARTIAL_SUFFIXES) {
        if (filename.size() > suffix.size() && filename.ends_with(suffix)) {
            return true;
        }
    }
    if (has_fragment_marker(filename)) {
        return true;
    }

    // <name>.f<N>.<ext> and <name>.temp.<ext>
    auto base = filename;
    if (!drop_component(base, [](std::string_view ext) { return !ext.empty(); })) {
        return false;
    }
    if (base.size() > MERGE_TAG.size() && base.ends_with(MERGE_TAG)) {
        return true;
    }
    return drop_component(base, is_format_tag);
}

std::string CleanupService::artifact_stem(std::string_view filename) {
    auto name = filename;
    while (drop_partial_suffix(name)) {
    }
    drop_component(name, [](std::string_view ext) { return !ext.empty(); });
    if (name.size() > MERGE_TAG.size() && name.ends_with(MERGE_TAG)) {
        name.remove_suffix(MERGE_TAG.size());
    } else {
        drop_component(name, is_format_tag);
    }
    return std::string(name);
}

std::size_t CleanupService::purge(const fs::path& dir) {
    return remove_matching(dir, nullptr);
}

std::size_t CleanupService::purge(const fs::path& dir, const std::vector<std::string>& stems) {
    if (stems.empty()) {
        spdlog::debug("Cleanup of {} skipped, no files were reported", dir.string());
        return 0;
    }
    return remove_matching(dir, &stems);
}

bool CleanupService::remove_file(const fs::path& path, std::error_code& ec) {
    return fs::remove(path, ec);
}

std::size_t CleanupService::remove_matching(const fs::path& dir, const std::vector<std::string>* stems) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::warn("Cleanup skipped, {} is not a directory", dir.string());
        return 0;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::warn("Cleanup cannot list {}: {}", dir.string(), ec.message());
        return 0;
    }

    auto owned = [stems](const std::string& name) {
        if (!stems) return true;
        return std::any_of(stems->begin(), stems->end(), [&name](const std::string& stem) {
            return !stem.empty() && name.size() > stem.size()
                && name.starts_with(stem) && name[stem.size()] == '.';
        });
    };

    std::vector<fs::path> matches;
    for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (is_partial_artifact(name) && owned(name)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Cleanup stopped listing {}: {}", dir.string(), ec.message());
    }

    std::size_t removed = 0;
    for (const auto& path : matches) {
        std::error_code remove_ec;
        if (remove_file(path, remove_ec)) {
            spdlog::debug("Removed partial file {}", path.filename().string());
            ++removed;
        } else if (remove_ec) {
            spdlog::warn("Failed to remove partial file {}: {}", path.filename().string(), remove_ec.message());
        }
    }

    spdlog::info("Cleanup removed {} partial file(s) from {}", removed, dir.string());
    return removed;
}

} // namespace reel::core
