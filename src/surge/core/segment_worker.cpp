// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/segment_worker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>

namespace surge::core {

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, std::uint32_t attempt) noexcept {
    if (attempt == 0) attempt = 1;
    double factor = std::pow(std::max(policy.multiplier, 1.0), static_cast<double>(attempt - 1));
    double delay = static_cast<double>(policy.initial_backoff.count()) * factor;
    double cap = static_cast<double>(policy.max_backoff.count());
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::min(delay, cap)));
}

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    // Predicate only turns true on stop
    return !cv.wait_for(lock, stop, duration, [&stop] { return stop.stop_requested(); });
}

//=============================================================================
// SegmentWorker
//=============================================================================

SegmentWorker::SegmentWorker(Segment& segment, WorkerContext context) noexcept
    : segment_(segment)
    , ctx_(std::move(context)) {}

WorkerOutcome SegmentWorker::run(std::stop_token stop) {
    if (segment_.is_complete()) {
        segment_.state(SegmentState::completed);
        return WorkerOutcome::completed;
    }

    segment_.state(SegmentState::in_flight);
    segment_.error({});

    for (std::uint32_t attempt = 1;; ++attempt) {
        if (stop.stop_requested()) {
            segment_.state(SegmentState::paused);
            return WorkerOutcome::paused;
        }

        attempts_ = attempt;
        auto ec = this->attempt(stop);
        if (!ec) {
            segment_.state(SegmentState::completed);
            spdlog::debug("Segment {} complete ({} bytes, {} attempts)",
                          segment_.index(), segment_.downloaded(), attempt);
            return WorkerOutcome::completed;
        }

        if (ec == DownloadErrc::cancelled || stop.stop_requested()) {
            segment_.state(SegmentState::paused);
            return WorkerOutcome::paused;
        }

        segment_.error(ec);

        if (is_retriable(ec) && attempt < ctx_.retry.max_attempts) {
            segment_.add_retry();
            auto delay = backoff_delay(ctx_.retry, attempt);
            spdlog::warn("Segment {} attempt {}/{} failed: {}; retrying from byte {} in {} ms",
                         segment_.index(), attempt, ctx_.retry.max_attempts, ec.message(),
                         segment_.resume_offset(), delay.count());
            if (!interruptible_sleep(delay, stop)) {
                segment_.state(SegmentState::paused);
                return WorkerOutcome::paused;
            }
            continue;
        }

        spdlog::error("Segment {} failed after {} attempt(s): {}",
                      segment_.index(), attempt, ec.message());
        segment_.state(SegmentState::failed);
        return WorkerOutcome::failed;
    }
}

void SegmentWorker::restart_from_zero() {
    auto discarded = segment_.downloaded();
    if (discarded > 0) {
        ctx_.progress.rewind(discarded);
    }
    segment_.set_downloaded(0);
}

std::error_code SegmentWorker::attempt(std::stop_token stop) {
    std::optional<ConnectionLimiter::Slot> slot;
    if (ctx_.limiter) {
        slot = ctx_.limiter->acquire(stop);
        if (!slot) {
            return make_error_code(DownloadErrc::cancelled);
        }
    }

    if (!ctx_.ranges_supported && segment_.downloaded() > 0) {
        // Nothing to resume against; the body always starts at byte 0
        spdlog::warn("Segment {}: server has no range support, restarting from zero",
                     segment_.index());
        restart_from_zero();
    }

    const auto length = segment_.length();
    const std::uint64_t start = segment_.resume_offset();

    net::HttpRequest request = ctx_.request;
    if (ctx_.ranges_supported && !(ctx_.whole_resource && start == 0 && !length)) {
        net::ByteRange range{start, std::nullopt};
        if (length) {
            range.last = segment_.offset() + *length - 1;
        }
        request.range = range;
    } else {
        request.range.reset();
    }
    const bool ranged = request.range.has_value();

    // Ends the transfer locally once the segment is full
    std::stop_source transfer;
    std::stop_callback link(stop, [&transfer] { transfer.request_stop(); });
    bool segment_full = false;

    auto on_headers = [&](const net::HttpResponse& response) -> std::error_code {
        if (response.status_code == 206) {
            if (!ranged) {
                return make_error_code(DownloadErrc::unexpected_status);
            }
            const auto& cr = response.content_range;
            if (!cr || !cr->satisfied || cr->first != start) {
                return make_error_code(DownloadErrc::content_range_mismatch);
            }
            return {};
        }
        if (response.status_code == 200) {
            if (!ranged) {
                return {};
            }
            if (ctx_.whole_resource && segment_.offset() == 0) {
                // Range ignored: the full body is exactly this segment
                if (segment_.downloaded() > 0) {
                    spdlog::warn("Segment {}: server ignored range, discarding {} bytes and restarting",
                                 segment_.index(), segment_.downloaded());
                }
                restart_from_zero();
                return {};
            }
            spdlog::warn("Segment {}: server answered 200 to a ranged request", segment_.index());
            return make_error_code(DownloadErrc::range_ignored);
        }
        if (auto ec = net::status_to_error(response.status_code)) {
            return ec;
        }
        return make_error_code(DownloadErrc::unexpected_status);
    };

    auto on_body = [&](std::span<const std::byte> chunk) -> std::error_code {
        if (segment_full) {
            return {};
        }
        auto len = segment_.length();
        auto done = segment_.downloaded();
        if (len) {
            auto remaining = *len > done ? *len - done : 0;
            if (chunk.size() >= remaining) {
                chunk = chunk.first(static_cast<std::size_t>(remaining));
                segment_full = true;
            }
        }
        if (!chunk.empty()) {
            if (auto ec = ctx_.file.write(segment_.offset() + done, chunk)) {
                return ec;
            }
            segment_.add_downloaded(chunk.size());
            ctx_.progress.record(chunk.size());
        }
        if (segment_full) {
            transfer.request_stop();
        }
        return {};
    };

    auto result = ctx_.http.get(request, on_headers, on_body, transfer.get_token());

    if (!result) {
        auto ec = result.error();
        if (ec == DownloadErrc::cancelled && segment_full && !stop.stop_requested()) {
            return {};
        }
        return ec;
    }

    if (length) {
        if (segment_.downloaded() < *length) {
            // Server closed early
            return make_error_code(DownloadErrc::connection_lost);
        }
    } else {
        segment_.set_length(segment_.downloaded());
    }
    return {};
}

} // namespace surge::core
