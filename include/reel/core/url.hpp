// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace reel::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// True for hosts the fetch engine is expected to handle
[[nodiscard]] bool is_recognized_host(std::string_view host) noexcept;

// Parses `url_str` (surrounding whitespace ignored) and checks it is an
// http(s) URL on a recognized host.
// Errors: SessionErrc::invalid_url, SessionErrc::unsupported_host.
[[nodiscard]] std::expected<Url, std::error_code> validate_media_url(std::string_view url_str) noexcept;

} // namespace reel::core
