// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/logging.hpp>
#include <reel/core/error.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reel::core {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LEVELS = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) noexcept {
    for (const auto& [name, level] : LEVELS) {
        if (text == name) {
            return level;
        }
    }
    if (text == "warning") return spdlog::level::warn;
    return std::nullopt;
}

std::error_code init_logging(std::string_view level, const std::filesystem::path& file) noexcept {
    auto parsed = parse_log_level(level);
    if (!parsed) {
        return make_error_code(SessionErrc::invalid_settings);
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        std::string file_error;
        if (!file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>(std::string(LOGGER_NAME), sinks.begin(), sinks.end());
        logger->set_level(*parsed);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::warn);

        spdlog::drop(std::string(LOGGER_NAME));
        spdlog::set_default_logger(std::move(logger));

        if (!file_error.empty()) {
            spdlog::warn("Logging to stderr only: {}", file_error);
            return std::make_error_code(std::errc::io_error);
        }
        return {};
    } catch (const std::exception&) {
        return std::make_error_code(std::errc::io_error);
    }
}

} // namespace reel::core
