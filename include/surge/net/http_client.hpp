// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace surge::net {

// Inclusive byte range; an open range (no last) means "to end of resource"
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last;

    // "bytes=first-last" / "bytes=first-"
    [[nodiscard]] std::string to_header_value() const;
};

// Parsed Content-Range header
struct ContentRange {
    bool satisfied{true};              // false for "bytes */total"
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total; // nullopt for ".../*"

    [[nodiscard]] std::uint64_t length() const noexcept {
        return satisfied ? last - first + 1 : 0;
    }
};

struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lower-case names, last value wins
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range;
    bool accepts_ranges{false};                   // Accept-Ranges: bytes
    bool conflicting_length{false};               // Duplicate Content-Length with different values
    std::string etag;
    std::string last_modified;
    std::string content_type;
    std::string server;
    std::string filename;                         // From Content-Disposition

    [[nodiscard]] bool is_success() const noexcept { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_partial() const noexcept { return status_code == 206; }
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;
    std::chrono::milliseconds connect_timeout{30'000};
    std::chrono::milliseconds read_timeout{30'000};
    std::uint64_t max_recv_speed{0};              // Bytes/s, 0 = unlimited
    std::string user_agent;
    bool verify_tls{true};
};

// Called once with the final response headers, before any body bytes.
// Returning an error aborts the transfer with that error.
using HeadersHandler = std::function<std::error_code(const HttpResponse&)>;

// Called for every body chunk. Returning an error aborts the transfer with that error.
using BodyHandler = std::function<std::error_code(std::span<const std::byte>)>;

// Transport seam. Implementations report transport failures as errors and
// return the response for any HTTP status; status interpretation is the caller's.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) = 0;

    // Stream the body; stop requests end the transfer with DownloadErrc::cancelled
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const HeadersHandler& on_headers,
        const BodyHandler& on_body,
        std::stop_token stop) = 0;
};

// Feed one raw header line ("Name: value\r\n" or a status line) into a response.
// A status line starts a new header block, which discards headers of a redirect.
void parse_header_line(std::string_view line, HttpResponse& response);

// Derive the typed fields (length, range, validators, filename) from headers
void finalize_headers(HttpResponse& response);

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Filename from a Content-Disposition value; prefers filename*=UTF-8''...
[[nodiscard]] std::string parse_content_disposition(std::string_view value);

// Map an HTTP status onto the error taxonomy; 2xx and 3xx are not errors
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

} // namespace surge::net
