// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace surge::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool valid_port(std::string_view port) noexcept {
    if (port.empty() || port.size() > 5) return false;
    unsigned value = 0;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value > 0 && value <= 65535;
}

} // namespace

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    try {
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (!url.is_http()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        const auto rest_start = scheme_end + 3;
        const auto len = url_str.size();

        auto path_start = std::min(url_str.find('/', rest_start), len);
        auto query_start = std::min(url_str.find('?', rest_start), len);
        auto fragment_start = std::min(url_str.find('#', rest_start), len);
        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }
        auto authority = url_str.substr(authority_start, host_end - authority_start);

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal, [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto after = authority.substr(bracket_end + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (url.host_.empty() || (!url.port_.empty() && !valid_port(url.port_))) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        for (char c : url.host_) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
        }

        if (path_start < len && path_start == host_end) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    return url;
}

std::uint16_t Url::default_port() const noexcept {
    if (!port_.empty()) {
        unsigned value = 0;
        for (char c : port_) {
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        return static_cast<std::uint16_t>(value);
    }
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    return percent_decode(name);
}

} // namespace surge::core
