// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/net/http_client.hpp>
#include <surge/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace surge::net {

using core::DownloadErrc;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool iequals_prefix(std::string_view s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

const std::string* find_header(const HttpResponse& response, const char* name) {
    auto it = response.headers.find(name);
    return it == response.headers.end() ? nullptr : &it->second;
}

} // namespace

std::string ByteRange::to_header_value() const {
    std::string value = "bytes=" + std::to_string(first) + "-";
    if (last) {
        value += std::to_string(*last);
    }
    return value;
}

void parse_header_line(std::string_view line, HttpResponse& response) {
    auto trimmed = trim(line);
    if (trimmed.empty()) {
        return;
    }

    // "HTTP/1.1 206 Partial Content" resets per-response state
    if (iequals_prefix(trimmed, "HTTP/")) {
        response.headers.clear();
        response.conflicting_length = false;
        auto sp = trimmed.find(' ');
        if (sp != std::string_view::npos) {
            auto code = trimmed.substr(sp + 1, 3);
            int status = 0;
            auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
            if (ec == std::errc{}) {
                response.status_code = status;
            }
        }
        return;
    }

    auto colon = trimmed.find(':');
    if (colon == std::string_view::npos) {
        return;
    }

    auto name = to_lower(trim(trimmed.substr(0, colon)));
    auto value = std::string(trim(trimmed.substr(colon + 1)));

    if (name == "content-length") {
        auto existing = response.headers.find(name);
        if (existing != response.headers.end() && existing->second != value) {
            response.conflicting_length = true;
        }
    }
    response.headers[name] = std::move(value);
}

void finalize_headers(HttpResponse& response) {
    if (const auto* cl = find_header(response, "content-length")) {
        response.content_length = parse_u64(*cl);
    }
    if (const auto* cr = find_header(response, "content-range")) {
        response.content_range = parse_content_range(*cr);
    }
    if (const auto* ar = find_header(response, "accept-ranges")) {
        response.accepts_ranges = to_lower(*ar).find("bytes") != std::string::npos;
    }
    if (const auto* etag = find_header(response, "etag")) {
        response.etag = *etag;
    }
    if (const auto* lm = find_header(response, "last-modified")) {
        response.last_modified = *lm;
    }
    if (const auto* ct = find_header(response, "content-type")) {
        response.content_type = *ct;
    }
    if (const auto* server = find_header(response, "server")) {
        response.server = *server;
    }
    if (const auto* cd = find_header(response, "content-disposition")) {
        response.filename = parse_content_disposition(*cd);
    }
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    value = trim(value);
    if (!iequals_prefix(value, "bytes")) {
        return std::nullopt;
    }
    value = trim(value.substr(5));

    auto slash = value.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    auto span_part = trim(value.substr(0, slash));
    auto total_part = trim(value.substr(slash + 1));

    ContentRange range;
    if (total_part != "*") {
        range.total = parse_u64(total_part);
        if (!range.total) {
            return std::nullopt;
        }
    }

    if (span_part == "*") {
        if (!range.total) {
            return std::nullopt;
        }
        range.satisfied = false;
        return range;
    }

    auto dash = span_part.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto first = parse_u64(span_part.substr(0, dash));
    auto last = parse_u64(span_part.substr(dash + 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }
    if (range.total && *last >= *range.total) {
        return std::nullopt;
    }
    range.first = *first;
    range.last = *last;
    return range;
}

std::string parse_content_disposition(std::string_view value) {
    std::string plain;
    std::string extended;

    std::size_t pos = 0;
    while (pos < value.size()) {
        auto semi = value.find(';', pos);
        if (semi == std::string_view::npos) semi = value.size();
        auto param = trim(value.substr(pos, semi - pos));
        pos = semi + 1;

        auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = to_lower(trim(param.substr(0, eq)));
        auto val = trim(param.substr(eq + 1));

        if (key == "filename*") {
            // charset'lang'percent-encoded
            auto q1 = val.find('\'');
            if (q1 != std::string_view::npos) {
                auto q2 = val.find('\'', q1 + 1);
                if (q2 != std::string_view::npos) {
                    extended = core::percent_decode(val.substr(q2 + 1));
                }
            }
        } else if (key == "filename") {
            if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
                val = val.substr(1, val.size() - 2);
            } else if (!val.empty() && (val.front() == '"' || val.front() == '\'')) {
                // Unterminated quote
                val.remove_prefix(1);
            }
            plain = std::string(val);
        }
    }

    std::string name = extended.empty() ? plain : extended;

    // Never let a server pick a directory
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name == "." || name == "..") {
        name.clear();
    }
    return name;
}

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status >= 200 && status < 400) {
        return {};
    }
    switch (status) {
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 401:
        case 403: return make_error_code(DownloadErrc::forbidden);
        case 416: return make_error_code(DownloadErrc::range_not_satisfiable);
        case 408:
        case 429: return make_error_code(DownloadErrc::throttled);
        default:  break;
    }
    if (status >= 400 && status < 500) {
        return make_error_code(DownloadErrc::http_client_error);
    }
    if (status >= 500 && status < 600) {
        return make_error_code(DownloadErrc::server_error);
    }
    return make_error_code(DownloadErrc::unexpected_status);
}

} // namespace surge::net
