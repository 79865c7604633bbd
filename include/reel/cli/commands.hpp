// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/session.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace reel::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CANCELLED = 130;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir;
    std::string config_file;
    core::QualityTier quality{core::QualityTier::max};
    bool audio_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;   // Unusable arguments, reported by main
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Reads settings, starts logging and runs one session to its end.
// Returns EXIT_OK, EXIT_FAILED or EXIT_CANCELLED.
[[nodiscard]] int download(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
