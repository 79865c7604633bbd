// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <reel/core/format.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reel::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(const core::ProgressSnapshot& snapshot) {
    if (snapshot.indeterminate() || snapshot.stage == core::Stage::fetching_metadata) {
        ++spinner_frame_;
    }

    auto line = render(snapshot);
    if (line == last_line_) {
        return;
    }

    std::string padded = "\r" + line;
    if (line.size() < last_width_) {
        padded += std::string(last_width_ - line.size(), ' ');
    }

    last_width_ = line.size();
    last_line_ = std::move(line);
    drawn_ = true;
    std::cout << padded << std::flush;
}

void ProgressBar::finish() noexcept {
    if (drawn_) {
        std::cout << std::endl;
        drawn_ = false;
    }
    last_line_.clear();
    last_width_ = 0;
}

void ProgressBar::clear() noexcept {
    if (drawn_) {
        std::cout << "\r" << std::string(last_width_, ' ') << "\r" << std::flush;
        drawn_ = false;
    }
    last_line_.clear();
    last_width_ = 0;
}

std::string ProgressBar::render(const core::ProgressSnapshot& snapshot) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (snapshot.item_total > 1) {
        line += "[" + std::to_string(std::max<std::uint32_t>(snapshot.item_index, 1))
              + "/" + std::to_string(snapshot.item_total) + "] ";
    }

    if (snapshot.stage == core::Stage::fetching_metadata) {
        line += SPINNER_FRAMES[spinner_frame_ % 4];
        line += " Fetching metadata";
        if (!snapshot.current_item_name.empty()) {
            line += ": " + snapshot.current_item_name;
        }
        return line;
    }

    if (snapshot.indeterminate()) {
        line += SPINNER_FRAMES[spinner_frame_ % 4];
        line += " ";
    } else {
        line += render_bar(snapshot.percent);

        std::ostringstream pct;
        pct << std::fixed << std::setprecision(1) << std::setw(5) << snapshot.percent;
        line += " " + pct.str() + "%";
    }

    if (!snapshot.size_text.empty()) {
        line += " (" + snapshot.size_text + ")";
    }

    if (!snapshot.speed_text.empty()) {
        line += " @ " + snapshot.speed_text;
    }

    // ETA for the current item
    if (snapshot.speed_bps > 0 && snapshot.bytes_total > snapshot.bytes_done) {
        auto eta = (snapshot.bytes_total - snapshot.bytes_done) / snapshot.speed_bps;
        line += " ETA: " + core::format_duration(eta);
    }

    if (snapshot.stage == core::Stage::finishing) {
        line += " finishing";
    }

    return line;
}

std::string ProgressBar::render_bar(double percent) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

} // namespace reel::cli
