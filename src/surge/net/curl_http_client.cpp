// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/net/curl_http_client.hpp>
#include <surge/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace surge::net {

using core::DownloadErrc;

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlSlist {
    curl_slist* ptr = nullptr;

    CurlSlist() = default;
    ~CurlSlist() { if (ptr) curl_slist_free_all(ptr); }

    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;

    bool append(const std::string& line) noexcept {
        auto* next = curl_slist_append(ptr, line.c_str());
        if (!next) return false;
        ptr = next;
        return true;
    }
};

struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const HeadersHandler* on_headers{nullptr};
    const BodyHandler* on_body{nullptr};
    std::stop_token stop;
    bool headers_delivered{false};
    std::error_code handler_error;
};

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;
    parse_header_line(std::string_view(buffer, total), ctx->response);
    return total;
}

// Resolve the status from curl and hand the headers to the caller once
std::error_code deliver_headers(TransferContext& ctx) {
    if (ctx.headers_delivered) return {};
    ctx.headers_delivered = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 0) {
        ctx.response.status_code = static_cast<std::int32_t>(http_code);
    }
    finalize_headers(ctx.response);

    if (ctx.on_headers && *ctx.on_headers) {
        return (*ctx.on_headers)(ctx.response);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return 0;
    std::size_t total = size * nitems;

    if (ctx->stop.stop_requested()) {
        ctx->handler_error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    try {
        if (auto ec = deliver_headers(*ctx)) {
            ctx->handler_error = ec;
            return 0;
        }
        if (ctx->on_body && *ctx->on_body) {
            auto chunk = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total);
            if (auto ec = (*ctx->on_body)(chunk)) {
                ctx->handler_error = ec;
                return 0;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Body handler threw: {}", e.what());
        ctx->handler_error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return total;
}

int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->stop.stop_requested()) ? 1 : 0;
}

void apply_common_options(CURL* curl, const HttpRequest& request) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, core::FOLLOW_REDIRECTS ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));

    // Stall detection: under 1 byte/s for read_timeout aborts the transfer
    auto stall_sec = std::max<long>(1, static_cast<long>(request.read_timeout.count() / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_sec);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);
    if (!request.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

//=============================================================================
// CurlHttpClient
//=============================================================================

CurlHttpClient::CurlHttpClient() {
    global_init();
}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::head(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;

    apply_common_options(curl.ptr, request);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    finalize_headers(ctx.response);
    return std::move(ctx.response);
}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::get(const HttpRequest& request,
                    const HeadersHandler& on_headers,
                    const BodyHandler& on_body,
                    std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.on_headers = &on_headers;
    ctx.on_body = &on_body;
    ctx.stop = stop;

    apply_common_options(curl.ptr, request);

    // Explicit Range header so "bytes=0-" is sent verbatim
    CurlSlist headers;
    if (request.range) {
        if (!headers.append("Range: " + request.range->to_header_value())) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);
    }
    // Identity encoding keeps body byte counts equal to resource offsets
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, nullptr);

    if (request.max_recv_speed > 0) {
        curl_easy_setopt(curl.ptr, CURLOPT_MAX_RECV_SPEED_LARGE,
                         static_cast<curl_off_t>(request.max_recv_speed));
    }
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(core::READ_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.handler_error) {
        return std::unexpected(ctx.handler_error);
    }
    if (result != CURLE_OK) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }
        spdlog::debug("GET {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    // Empty body: headers still go to the caller
    try {
        if (auto ec = deliver_headers(ctx)) {
            return std::unexpected(ec);
        }
    } catch (const std::exception& e) {
        spdlog::error("Headers handler threw: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
    return std::move(ctx.response);
}

void CurlHttpClient::global_init() noexcept {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace surge::net
