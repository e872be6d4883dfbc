// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/connection_limiter.hpp>
#include <surge/core/progress_aggregator.hpp>
#include <surge/core/segment.hpp>
#include <surge/disk/file_writer.hpp>
#include <surge/net/http_client.hpp>
#include <chrono>
#include <cstdint>
#include <stop_token>

namespace surge::core {

enum class WorkerOutcome : std::uint8_t {
    completed,
    paused,     // Stop requested; offset recorded in the segment
    failed      // Non-retriable error or retries exhausted; see Segment::error()
};

// Everything a worker borrows from its task
struct WorkerContext {
    net::HttpClient& http;
    disk::FileWriter& file;
    ProgressAggregator& progress;
    ConnectionLimiter* limiter{nullptr};          // Null = no global ceiling
    RetryPolicy retry{};
    net::HttpRequest request;                     // url, timeouts, per-worker speed cap
    bool ranges_supported{true};
    bool whole_resource{false};                   // Single segment covering the entire file
};

// Downloads one segment: ranged GET from offset + downloaded, positional writes,
// local retry with exponential backoff. One worker per run; a resumed segment
// gets a fresh worker starting from its recorded offset.
class SegmentWorker {
public:
    SegmentWorker(Segment& segment, WorkerContext context) noexcept;

    SegmentWorker(const SegmentWorker&) = delete;
    SegmentWorker& operator=(const SegmentWorker&) = delete;

    [[nodiscard]] WorkerOutcome run(std::stop_token stop);

    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_; }

private:
    // One HTTP transfer; empty error when the segment is complete
    [[nodiscard]] std::error_code attempt(std::stop_token stop);

    // Throw away everything written so far and start over at byte 0
    void restart_from_zero();

    Segment& segment_;
    WorkerContext ctx_;
    std::uint32_t attempts_{0};
};

// min(initial * multiplier^(attempt-1), max_backoff); attempt is 1-based
[[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy& policy,
                                                      std::uint32_t attempt) noexcept;

// Sleep unless stopped; false when the stop request cut the wait short
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

} // namespace surge::core
