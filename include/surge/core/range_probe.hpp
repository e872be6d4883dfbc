// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <surge/core/url.hpp>
#include <surge/net/http_client.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace surge::core {

// What the server told us about the resource
struct ProbeResult {
    bool supports_ranges{false};
    std::optional<std::uint64_t> total_size;
    bool accepts_validators{false};   // ETag or Last-Modified present
    std::string etag;
    std::string last_modified;
    std::string content_type;
    std::string server;
    std::string filename;             // From Content-Disposition
    bool head_supported{true};        // False when the ranged GET fallback answered
};

// Capability check: HEAD, falling back to GET "bytes=0-0" when HEAD is
// rejected or does not report a size. Stateless apart from the network call.
class RangeProbe {
public:
    // request_template carries timeouts, user agent and TLS settings; url/range are overwritten
    RangeProbe(net::HttpClient& http, net::HttpRequest request_template) noexcept;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(std::string_view url, std::stop_token stop = {}) const;

private:
    [[nodiscard]] std::expected<net::HttpResponse, std::error_code>
    ranged_get(std::string_view url, std::stop_token stop) const;

    net::HttpClient& http_;
    net::HttpRequest template_;
};

// Content-Disposition name, else the URL's last path component, else download_<unix-time>
[[nodiscard]] std::string suggest_filename(const ProbeResult& probe, const Url& url);

} // namespace surge::core
