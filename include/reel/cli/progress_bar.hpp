// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/session.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Single-line terminal rendering of a progress snapshot
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraws when the visible text changed
    void update(const core::ProgressSnapshot& snapshot);

    // Moves past the bar line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // Text of the last update, without the leading carriage return
    [[nodiscard]] const std::string& last_line() const noexcept { return last_line_; }

    // Builds the status line for `snapshot`
    [[nodiscard]] std::string render(const core::ProgressSnapshot& snapshot) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    std::string last_line_;
    std::size_t last_width_{0};
    std::size_t spinner_frame_{0};
    bool drawn_{false};
};

} // namespace reel::cli
