// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace surge::core {

// Concrete failure causes reported by the engine
enum class DownloadErrc {
    success = 0,

    // Transport
    network_error,
    timeout,
    refused,
    dns_error,
    connection_lost,
    ssl_error,
    too_many_redirects,

    // HTTP status
    server_error,           // 5xx
    throttled,              // 408, 429
    not_found,              // 404, 410
    forbidden,              // 401, 403
    http_client_error,      // other 4xx
    range_not_satisfiable,  // 416
    unexpected_status,
    range_ignored,          // 200 where 206 was required
    content_range_mismatch,

    // Probe
    unreachable,
    probe_failed,
    probe_ambiguous,

    // Resume
    resume_not_found,
    resume_corrupt,
    resume_stale,

    // Finalize
    size_mismatch,
    checksum_mismatch,

    // Caller errors
    invalid_url,
    invalid_argument,
    invalid_state,
    unknown_task,
    invalid_config,

    cancelled,
};

// Failure taxonomy; every DownloadErrc and DiskErrc maps onto exactly one kind
enum class ErrorKind {
    probe = 1,
    transient_network,
    permanent_http,
    resume_corrupt,
    verification,
    filesystem,
    cancelled,
    usage,
};

namespace detail {

struct ErrorKindCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::kind";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ErrorKind>(ev)) {
            case ErrorKind::probe:             return "Probe error";
            case ErrorKind::transient_network: return "Transient network error";
            case ErrorKind::permanent_http:    return "Permanent HTTP error";
            case ErrorKind::resume_corrupt:    return "Resume state corrupt";
            case ErrorKind::verification:      return "Verification error";
            case ErrorKind::filesystem:        return "Filesystem error";
            case ErrorKind::cancelled:         return "Cancelled";
            case ErrorKind::usage:             return "Usage error";
            default:                           return "Unknown error kind";
        }
    }
};

} // namespace detail

inline const detail::ErrorKindCategory& error_kind_category() noexcept {
    static detail::ErrorKindCategory category;
    return category;
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), error_kind_category()};
}

[[nodiscard]] constexpr ErrorKind kind_of(DownloadErrc e) noexcept {
    switch (e) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::refused:
        case DownloadErrc::dns_error:
        case DownloadErrc::connection_lost:
        case DownloadErrc::server_error:
        case DownloadErrc::throttled:
        case DownloadErrc::content_range_mismatch:
            return ErrorKind::transient_network;

        case DownloadErrc::ssl_error:
        case DownloadErrc::too_many_redirects:
        case DownloadErrc::not_found:
        case DownloadErrc::forbidden:
        case DownloadErrc::http_client_error:
        case DownloadErrc::range_not_satisfiable:
        case DownloadErrc::unexpected_status:
        case DownloadErrc::range_ignored:
            return ErrorKind::permanent_http;

        case DownloadErrc::unreachable:
        case DownloadErrc::probe_failed:
        case DownloadErrc::probe_ambiguous:
            return ErrorKind::probe;

        case DownloadErrc::resume_not_found:
        case DownloadErrc::resume_corrupt:
        case DownloadErrc::resume_stale:
            return ErrorKind::resume_corrupt;

        case DownloadErrc::size_mismatch:
        case DownloadErrc::checksum_mismatch:
            return ErrorKind::verification;

        case DownloadErrc::cancelled:
            return ErrorKind::cancelled;

        case DownloadErrc::success:
        case DownloadErrc::invalid_url:
        case DownloadErrc::invalid_argument:
        case DownloadErrc::invalid_state:
        case DownloadErrc::unknown_task:
        case DownloadErrc::invalid_config:
            return ErrorKind::usage;
    }
    return ErrorKind::usage;
}

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::refused:                return "Connection refused";
            case DownloadErrc::dns_error:              return "DNS resolution failed";
            case DownloadErrc::connection_lost:        return "Connection lost";
            case DownloadErrc::ssl_error:              return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:     return "Too many redirects";
            case DownloadErrc::server_error:           return "Server error (5xx)";
            case DownloadErrc::throttled:              return "Server asked to retry later";
            case DownloadErrc::not_found:              return "Resource not found (404)";
            case DownloadErrc::forbidden:              return "Access forbidden (401/403)";
            case DownloadErrc::http_client_error:      return "HTTP client error (4xx)";
            case DownloadErrc::range_not_satisfiable:  return "Range not satisfiable (416)";
            case DownloadErrc::unexpected_status:      return "Unexpected HTTP status";
            case DownloadErrc::range_ignored:          return "Server ignored the byte range";
            case DownloadErrc::content_range_mismatch: return "Content-Range does not match request";
            case DownloadErrc::unreachable:            return "Server unreachable";
            case DownloadErrc::probe_failed:           return "Capability probe rejected";
            case DownloadErrc::probe_ambiguous:        return "Capability probe ambiguous";
            case DownloadErrc::resume_not_found:       return "No resume record";
            case DownloadErrc::resume_corrupt:         return "Resume record corrupt";
            case DownloadErrc::resume_stale:           return "Resume record stale";
            case DownloadErrc::size_mismatch:          return "File size mismatch";
            case DownloadErrc::checksum_mismatch:      return "Checksum mismatch";
            case DownloadErrc::invalid_url:            return "Invalid URL";
            case DownloadErrc::invalid_argument:       return "Invalid argument";
            case DownloadErrc::invalid_state:          return "Operation not valid in current state";
            case DownloadErrc::unknown_task:           return "Unknown task";
            case DownloadErrc::invalid_config:         return "Invalid configuration";
            case DownloadErrc::cancelled:              return "Download cancelled";
            default:                                   return "Unknown error";
        }
    }

    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        return make_error_condition(kind_of(static_cast<DownloadErrc>(ev)));
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Only transient network failures are retried by a segment worker
[[nodiscard]] inline bool is_retriable(const std::error_code& ec) noexcept {
    return ec == make_error_condition(ErrorKind::transient_network);
}

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::DownloadErrc> : true_type {};

template<>
struct is_error_condition_enum<surge::core::ErrorKind> : true_type {};

} // namespace std
