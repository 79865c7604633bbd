// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

enum class SessionErrc {
    success = 0,
    invalid_url,
    unsupported_host,
    busy,
    content_unavailable,
    no_matching_format,
    auth_required,
    engine_failure,
    tool_missing,
    storage_unavailable,
    unexpected_error,
    cancelled,
    invalid_settings,
    already_initialized,
};

// Coarse grouping used for user-facing reporting
enum class ErrorKind : std::uint8_t {
    none,
    validation,
    busy,
    engine,
    environment,
    cancelled,
    unexpected,
    configuration,
};

namespace detail {

struct SessionErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::session";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<SessionErrc>(ev)) {
            case SessionErrc::success:              return "Success";
            case SessionErrc::invalid_url:          return "Invalid URL";
            case SessionErrc::unsupported_host:     return "Unsupported host";
            case SessionErrc::busy:                 return "A session is already active";
            case SessionErrc::content_unavailable:  return "Content unavailable";
            case SessionErrc::no_matching_format:   return "No matching format";
            case SessionErrc::auth_required:        return "Authentication required";
            case SessionErrc::engine_failure:       return "Engine failure";
            case SessionErrc::tool_missing:         return "Required tool not found";
            case SessionErrc::storage_unavailable:  return "Output directory unavailable";
            case SessionErrc::unexpected_error:     return "Unexpected error";
            case SessionErrc::cancelled:            return "Cancelled";
            case SessionErrc::invalid_settings:     return "Invalid settings";
            case SessionErrc::already_initialized:  return "Settings already initialized";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::SessionErrcCategory& session_errc_category() noexcept {
    static detail::SessionErrcCategory category;
    return category;
}

inline std::error_code make_error_code(SessionErrc e) noexcept {
    return {static_cast<int>(e), session_errc_category()};
}

// Maps an error code onto the reporting taxonomy.
// Codes from foreign categories count as unexpected.
[[nodiscard]] ErrorKind error_kind(std::error_code ec) noexcept;

// Picks a SessionErrc for a raw engine message by matching known phrases.
// Falls back to engine_failure.
[[nodiscard]] SessionErrc classify_engine_message(std::string_view message) noexcept;

// Short text suitable for display. `detail` is the raw engine or exception
// message; it is only shown (truncated) for codes that have no fixed text.
[[nodiscard]] std::string user_message(std::error_code ec, std::string_view detail = {});

// "<kind>: <what()>" for a caught exception, e.g. "runtime error: boom"
[[nodiscard]] std::string exception_summary(const std::exception& e);

// Cuts `text` to at most `max_length` characters, marking the cut with "...".
[[nodiscard]] std::string truncate_message(std::string_view text, std::size_t max_length);

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::SessionErrc> : true_type {};

} // namespace std
