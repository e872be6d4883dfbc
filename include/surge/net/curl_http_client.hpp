// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/net/http_client.hpp>

namespace surge::net {

// libcurl easy-handle transport; one handle per request
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const HeadersHandler& on_headers,
        const BodyHandler& on_body,
        std::stop_token stop) override;

    // curl_global_init runs once on first construction; cleanup is the host's call at exit
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace surge::net
