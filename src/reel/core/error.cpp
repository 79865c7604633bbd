// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/error.hpp>
#include <reel/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <new>
#include <stdexcept>

namespace reel::core {

namespace {

struct KnownPhrase {
    std::string_view phrase;
    SessionErrc code;
};

// Matched case-insensitively, first hit wins
constexpr std::array<KnownPhrase, 14> KNOWN_PHRASES = {{
    {"video unavailable",                 SessionErrc::content_unavailable},
    {"this video is unavailable",         SessionErrc::content_unavailable},
    {"private video",                     SessionErrc::content_unavailable},
    {"has been removed",                  SessionErrc::content_unavailable},
    {"http error 404",                    SessionErrc::content_unavailable},
    {"requested format is not available", SessionErrc::no_matching_format},
    {"no video formats found",            SessionErrc::no_matching_format},
    {"format not available",              SessionErrc::no_matching_format},
    {"sign in to confirm",                SessionErrc::auth_required},
    {"login required",                    SessionErrc::auth_required},
    {"members-only",                      SessionErrc::auth_required},
    {"use --cookies",                     SessionErrc::auth_required},
    {"http error 403",                    SessionErrc::auth_required},
    {"not a valid url",                   SessionErrc::invalid_url},
}};

std::string to_lower(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

// yt-dlp prefixes its failures with "ERROR: " and often "[extractor] id: "
std::string_view strip_engine_prefix(std::string_view text) {
    constexpr std::string_view ERROR_PREFIX = "ERROR: ";
    if (text.starts_with(ERROR_PREFIX)) {
        text.remove_prefix(ERROR_PREFIX.size());
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

ErrorKind error_kind(std::error_code ec) noexcept {
    if (!ec) {
        return ErrorKind::none;
    }
    if (ec.category() != session_errc_category()) {
        return ErrorKind::unexpected;
    }

    switch (static_cast<SessionErrc>(ec.value())) {
        case SessionErrc::success:
            return ErrorKind::none;
        case SessionErrc::invalid_url:
        case SessionErrc::unsupported_host:
            return ErrorKind::validation;
        case SessionErrc::busy:
            return ErrorKind::busy;
        case SessionErrc::content_unavailable:
        case SessionErrc::no_matching_format:
        case SessionErrc::auth_required:
        case SessionErrc::engine_failure:
            return ErrorKind::engine;
        case SessionErrc::tool_missing:
        case SessionErrc::storage_unavailable:
            return ErrorKind::environment;
        case SessionErrc::cancelled:
            return ErrorKind::cancelled;
        case SessionErrc::invalid_settings:
        case SessionErrc::already_initialized:
            return ErrorKind::configuration;
        case SessionErrc::unexpected_error:
        default:
            return ErrorKind::unexpected;
    }
}

SessionErrc classify_engine_message(std::string_view message) noexcept {
    try {
        const std::string lower = to_lower(message);
        for (const auto& known : KNOWN_PHRASES) {
            if (lower.find(known.phrase) != std::string::npos) {
                return known.code;
            }
        }
    } catch (const std::exception&) {
        return SessionErrc::engine_failure;
    }
    return SessionErrc::engine_failure;
}

std::string truncate_message(std::string_view text, std::size_t max_length) {
    constexpr std::string_view ELLIPSIS = "...";
    if (text.size() <= max_length) {
        return std::string(text);
    }
    if (max_length <= ELLIPSIS.size()) {
        return std::string(text.substr(0, max_length));
    }
    std::string result(text.substr(0, max_length - ELLIPSIS.size()));
    result += ELLIPSIS;
    return result;
}

std::string exception_summary(const std::exception& e) {
    std::string_view kind = "exception";
    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        kind = "out of memory";
    } else if (dynamic_cast<const std::system_error*>(&e)) {
        kind = "system error";
    } else if (dynamic_cast<const std::invalid_argument*>(&e)) {
        kind = "invalid argument";
    } else if (dynamic_cast<const std::out_of_range*>(&e)) {
        kind = "out of range";
    } else if (dynamic_cast<const std::logic_error*>(&e)) {
        kind = "logic error";
    } else if (dynamic_cast<const std::runtime_error*>(&e)) {
        kind = "runtime error";
    }

    std::string_view what = e.what();
    if (what.empty()) {
        return std::string(kind);
    }
    return std::string(kind) + ": " + std::string(what);
}

std::string user_message(std::error_code ec, std::string_view detail) {
    const auto cleaned = strip_engine_prefix(detail);

    if (ec.category() == session_errc_category()) {
        switch (static_cast<SessionErrc>(ec.value())) {
            case SessionErrc::success:
                return {};
            case SessionErrc::invalid_url:
            case SessionErrc::unsupported_host:
                return "Please enter a valid YouTube URL";
            case SessionErrc::busy:
                return "A download is already in progress";
            case SessionErrc::content_unavailable:
                return "This video is unavailable";
            case SessionErrc::no_matching_format:
                return "No download matches the selected quality, try another one";
            case SessionErrc::auth_required:
                return "This video requires signing in";
            case SessionErrc::tool_missing:
                return "yt-dlp was not found. Install it (pip install -U yt-dlp) "
                       "or set \"ytdlp_path\" in the settings file";
            case SessionErrc::storage_unavailable:
                return "The output folder cannot be created or written to";
            case SessionErrc::cancelled:
                return {};
            case SessionErrc::invalid_settings:
            case SessionErrc::already_initialized:
                return "Settings error: " + truncate_message(cleaned.empty() ? ec.message() : cleaned,
                                                             MAX_MESSAGE_LENGTH);
            case SessionErrc::engine_failure:
                if (cleaned.empty()) {
                    return "Failed to download";
                }
                return "Failed to download: " + truncate_message(cleaned, MAX_MESSAGE_LENGTH);
            case SessionErrc::unexpected_error:
            default:
                break;
        }
    }

    return "Unexpected error: " + truncate_message(cleaned.empty() ? ec.message() : cleaned,
                                                   MAX_MESSAGE_LENGTH);
}

} // namespace reel::core
