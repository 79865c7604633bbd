// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/cleanup_service.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace reel::core;
namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("reel-cleanup-" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    void touch(const std::string& name) const {
        std::ofstream(path_ / name) << "x";
    }

private:
    fs::path path_;
};

// Refuses to delete one named file
class StubbornCleanup : public CleanupService {
public:
    explicit StubbornCleanup(std::string keep) : keep_(std::move(keep)) {}

    int attempts{0};

protected:
    bool remove_file(const fs::path& path, std::error_code& ec) override {
        ++attempts;
        if (path.filename() == keep_) {
            ec = std::make_error_code(std::errc::permission_denied);
            return false;
        }
        return CleanupService::remove_file(path, ec);
    }

private:
    std::string keep_;
};

} // namespace

TEST_CASE("CleanupService::is_partial_artifact", "[cleanup]") {
    SECTION("Partial downloads") {
        CHECK(CleanupService::is_partial_artifact("Song.webm.part"));
        CHECK(CleanupService::is_partial_artifact("Song.webm.ytdl"));
        CHECK(CleanupService::is_partial_artifact("Song.temp.mp3.temp"));
        CHECK(CleanupService::is_partial_artifact("Song.f251.webm.tmp"));
        CHECK(CleanupService::is_partial_artifact("Song.mp4.part-Frag12"));
        CHECK(CleanupService::is_partial_artifact("Song.mp4.part-Frag3.part"));
    }

    SECTION("Streams of a split video download") {
        CHECK(CleanupService::is_partial_artifact("Clip.f137.mp4"));
        CHECK(CleanupService::is_partial_artifact("Clip.f140.m4a"));
        CHECK(CleanupService::is_partial_artifact("Clip.f140.m4a.part"));
        CHECK(CleanupService::is_partial_artifact("Clip.temp.mp4"));
    }

    SECTION("Finished files are kept") {
        CHECK_FALSE(CleanupService::is_partial_artifact("Song.mp3"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Video.mp4"));
        CHECK_FALSE(CleanupService::is_partial_artifact("partial.mp4"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Song.mp4.part-Frag"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Song.mp4.part-FragX"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Live at the fair.mp4"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Clip.final.mp4"));
        CHECK_FALSE(CleanupService::is_partial_artifact("Clip.f.mp4"));
    }

    SECTION("A bare suffix is not an artifact") {
        CHECK_FALSE(CleanupService::is_partial_artifact(".part"));
        CHECK_FALSE(CleanupService::is_partial_artifact(".tmp"));
    }
}

TEST_CASE("CleanupService::artifact_stem", "[cleanup]") {
    CHECK(CleanupService::artifact_stem("Clip.mp4") == "Clip");
    CHECK(CleanupService::artifact_stem("Clip.f137.mp4") == "Clip");
    CHECK(CleanupService::artifact_stem("Clip.f140.m4a.part") == "Clip");
    CHECK(CleanupService::artifact_stem("Clip.temp.mp4") == "Clip");
    CHECK(CleanupService::artifact_stem("Clip.mp4.part-Frag3.part") == "Clip");
    CHECK(CleanupService::artifact_stem("Mr. Bean.webm") == "Mr. Bean");
    CHECK(CleanupService::artifact_stem("Clip") == "Clip");
    CHECK(CleanupService::artifact_stem("").empty());
}

TEST_CASE("CleanupService::purge", "[cleanup]") {
    CleanupService cleanup;

    SECTION("Removes only partial files") {
        TempDir dir;
        dir.touch("Song.mp3");
        dir.touch("Song.webm.part");
        dir.touch("Song.webm.ytdl");
        dir.touch("Clip.mp4.part-Frag7");
        dir.touch("notes.txt");
        fs::create_directory(dir.path() / "nested.part");

        CHECK(cleanup.purge(dir.path()) == 3);

        CHECK(fs::exists(dir.path() / "Song.mp3"));
        CHECK(fs::exists(dir.path() / "notes.txt"));
        CHECK(fs::exists(dir.path() / "nested.part"));
        CHECK_FALSE(fs::exists(dir.path() / "Song.webm.part"));
        CHECK_FALSE(fs::exists(dir.path() / "Song.webm.ytdl"));
        CHECK_FALSE(fs::exists(dir.path() / "Clip.mp4.part-Frag7"));
    }

    SECTION("Second purge finds nothing") {
        TempDir dir;
        dir.touch("a.part");

        CHECK(cleanup.purge(dir.path()) == 1);
        CHECK(cleanup.purge(dir.path()) == 0);
    }

    SECTION("Missing directory is not an error") {
        CHECK(cleanup.purge(fs::temp_directory_path() / "reel-cleanup-does-not-exist") == 0);
    }
}

TEST_CASE("CleanupService::purge - split video download", "[cleanup]") {
    CleanupService cleanup;
    TempDir dir;
    dir.touch("Clip.f137.mp4");
    dir.touch("Clip.f140.m4a.part");
    dir.touch("Clip.temp.mp4");
    dir.touch("Other.mp4");

    CHECK(cleanup.purge(dir.path()) == 3);
    CHECK_FALSE(fs::exists(dir.path() / "Clip.f137.mp4"));
    CHECK_FALSE(fs::exists(dir.path() / "Clip.f140.m4a.part"));
    CHECK_FALSE(fs::exists(dir.path() / "Clip.temp.mp4"));
    CHECK(fs::exists(dir.path() / "Other.mp4"));
}

TEST_CASE("CleanupService::purge - limited to reported names", "[cleanup]") {
    CleanupService cleanup;
    TempDir dir;
    dir.touch("Clip.f137.mp4");
    dir.touch("Clip.f140.m4a.part");
    dir.touch("Clip 2.mp4.part");
    dir.touch("Holiday.mkv.part");
    dir.touch("Clip.mp4");

    SECTION("Only the listed stems") {
        CHECK(cleanup.purge(dir.path(), {"Clip"}) == 2);
        CHECK_FALSE(fs::exists(dir.path() / "Clip.f137.mp4"));
        CHECK_FALSE(fs::exists(dir.path() / "Clip.f140.m4a.part"));
        CHECK(fs::exists(dir.path() / "Clip 2.mp4.part"));
        CHECK(fs::exists(dir.path() / "Holiday.mkv.part"));
        CHECK(fs::exists(dir.path() / "Clip.mp4"));
    }

    SECTION("No stems removes nothing") {
        CHECK(cleanup.purge(dir.path(), std::vector<std::string>{}) == 0);
        CHECK(fs::exists(dir.path() / "Holiday.mkv.part"));
    }
}

TEST_CASE("CleanupService::purge - a failed delete does not stop the scan", "[cleanup]") {
    StubbornCleanup cleanup("b.part");
    TempDir dir;
    dir.touch("a.part");
    dir.touch("b.part");
    dir.touch("c.ytdl");

    CHECK(cleanup.purge(dir.path()) == 2);
    CHECK(cleanup.attempts == 3);
    CHECK(fs::exists(dir.path() / "b.part"));
    CHECK_FALSE(fs::exists(dir.path() / "a.part"));
    CHECK_FALSE(fs::exists(dir.path() / "c.ytdl"));
}
