// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/range_probe.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace surge::core {

namespace {

void copy_metadata(const net::HttpResponse& response, ProbeResult& result) {
    if (!response.etag.empty()) result.etag = response.etag;
    if (!response.last_modified.empty()) result.last_modified = response.last_modified;
    if (!response.content_type.empty()) result.content_type = response.content_type;
    if (!response.server.empty()) result.server = response.server;
    if (!response.filename.empty()) result.filename = response.filename;
    result.accepts_validators = !result.etag.empty() || !result.last_modified.empty();
}

} // namespace

RangeProbe::RangeProbe(net::HttpClient& http, net::HttpRequest request_template) noexcept
    : http_(http)
    , template_(std::move(request_template)) {}

std::expected<net::HttpResponse, std::error_code>
RangeProbe::ranged_get(std::string_view url, std::stop_token stop) const {
    net::HttpRequest request = template_;
    request.url = std::string(url);
    request.range = net::ByteRange{0, 0};
    request.max_recv_speed = 0;

    // Only the headers matter; stop the transfer as soon as they arrive
    std::stop_source local;
    std::stop_callback link(stop, [&local] { local.request_stop(); });

    std::optional<net::HttpResponse> captured;
    auto on_headers = [&](const net::HttpResponse& response) -> std::error_code {
        captured = response;
        local.request_stop();
        return {};
    };
    auto on_body = [](std::span<const std::byte>) -> std::error_code { return {}; };

    auto result = http_.get(request, on_headers, on_body, local.get_token());
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }
    if (captured) {
        return std::move(*captured);
    }
    if (!result) {
        return std::unexpected(result.error());
    }
    return result;
}

std::expected<ProbeResult, std::error_code>
RangeProbe::probe(std::string_view url, std::stop_token stop) const {
    ProbeResult result;

    net::HttpRequest request = template_;
    request.url = std::string(url);
    request.range.reset();

    auto head = http_.head(request);
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }
    if (!head) {
        if (head.error() == DownloadErrc::invalid_url || head.error() == DownloadErrc::cancelled) {
            return std::unexpected(head.error());
        }
        spdlog::warn("Probe {}: HEAD failed: {}", url, head.error().message());
        return std::unexpected(make_error_code(DownloadErrc::unreachable));
    }

    if (head->is_success()) {
        if (head->conflicting_length) {
            spdlog::warn("Probe {}: conflicting Content-Length headers", url);
            return std::unexpected(make_error_code(DownloadErrc::probe_ambiguous));
        }
        copy_metadata(*head, result);
        if (head->content_length) {
            // No Accept-Ranges means no ranges; HEAD is trusted without a GET check
            result.total_size = head->content_length;
            result.supports_ranges = head->accepts_ranges;
            spdlog::debug("Probe {}: HEAD {} size={} ranges={}", url, head->status_code,
                          *head->content_length, result.supports_ranges);
            return result;
        }
        spdlog::debug("Probe {}: HEAD reported no size, trying ranged GET", url);
    } else {
        spdlog::debug("Probe {}: HEAD returned {}, trying ranged GET", url, head->status_code);
        result.head_supported = false;
    }

    auto get = ranged_get(url, stop);
    if (!get) {
        if (get.error() == DownloadErrc::cancelled) {
            return std::unexpected(get.error());
        }
        spdlog::warn("Probe {}: ranged GET failed: {}", url, get.error().message());
        return std::unexpected(make_error_code(DownloadErrc::unreachable));
    }
    if (get->conflicting_length) {
        return std::unexpected(make_error_code(DownloadErrc::probe_ambiguous));
    }
    copy_metadata(*get, result);

    switch (get->status_code) {
        case 206: {
            result.supports_ranges = true;
            if (!get->content_range || !get->content_range->satisfied) {
                spdlog::warn("Probe {}: 206 without a usable Content-Range", url);
                return std::unexpected(make_error_code(DownloadErrc::probe_ambiguous));
            }
            result.total_size = get->content_range->total;
            break;
        }
        case 200:
            result.supports_ranges = false;
            result.total_size = get->content_length;
            break;
        case 416:
            // Range past the end: the resource is empty, its size comes from "*/total"
            if (get->content_range && !get->content_range->satisfied) {
                result.supports_ranges = true;
                result.total_size = get->content_range->total;
                break;
            }
            return std::unexpected(make_error_code(DownloadErrc::probe_failed));
        default:
            spdlog::warn("Probe {}: ranged GET returned {}", url, get->status_code);
            return std::unexpected(make_error_code(DownloadErrc::probe_failed));
    }

    spdlog::debug("Probe {}: GET {} size={} ranges={}", url, get->status_code,
                  result.total_size ? std::to_string(*result.total_size) : std::string("unknown"),
                  result.supports_ranges);
    return result;
}

std::string suggest_filename(const ProbeResult& probe, const Url& url) {
    if (!probe.filename.empty()) {
        return probe.filename;
    }
    auto name = url.filename();
    if (!name.empty()) {
        return name;
    }
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "download_" + std::to_string(now);
}

} // namespace surge::core
