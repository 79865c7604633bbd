// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace reel::core {

namespace {

constexpr std::array<std::string_view, 3> RECOGNIZED_DOMAINS = {
    "youtube.com",
    "youtu.be",
    "youtube-nocookie.com",
};

std::string to_lower(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(SessionErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip userinfo (user:pass@host)
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = to_lower(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = to_lower(url_str.substr(authority_start, host_end - authority_start));
        }

        if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(SessionErrc::invalid_url));
        }

        // Whitespace inside the authority means this was prose, not a URL
        if (std::any_of(url.host_.begin(), url.host_.end(),
                        [](unsigned char c) { return std::isspace(c); })) {
            return std::unexpected(make_error_code(SessionErrc::invalid_url));
        }

        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(SessionErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

bool is_recognized_host(std::string_view host) noexcept {
    for (auto domain : RECOGNIZED_DOMAINS) {
        if (host == domain) {
            return true;
        }
        // Subdomains such as www., m. and music.
        if (host.size() > domain.size() + 1 && host.ends_with(domain)
            && host[host.size() - domain.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

std::expected<Url, std::error_code> validate_media_url(std::string_view url_str) noexcept {
    auto trimmed = trim(url_str);
    if (trimmed.empty()) {
        return std::unexpected(make_error_code(SessionErrc::invalid_url));
    }

    auto parsed = Url::parse(trimmed);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    if (parsed->scheme() != "http" && parsed->scheme() != "https") {
        return std::unexpected(make_error_code(SessionErrc::invalid_url));
    }

    if (!is_recognized_host(parsed->host())) {
        return std::unexpected(make_error_code(SessionErrc::unsupported_host));
    }

    return parsed;
}

} // namespace reel::core
