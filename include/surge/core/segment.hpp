// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/segment_planner.hpp>
#include <atomic>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <system_error>

namespace surge::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,    // Not started
    in_flight,  // Worker running (including backoff waits)
    paused,     // Worker stopped, offset recorded
    completed,  // Every byte written
    failed      // Worker gave up
};

[[nodiscard]] constexpr const char* to_string(SegmentState s) noexcept {
    switch (s) {
        case SegmentState::pending:   return "pending";
        case SegmentState::in_flight: return "in_flight";
        case SegmentState::paused:    return "paused";
        case SegmentState::completed: return "completed";
        case SegmentState::failed:    return "failed";
    }
    return "unknown";
}

// Read-only copy for UI segment bars and resume checkpoints
struct SegmentView {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length;
    std::uint64_t downloaded{0};
    SegmentState state{SegmentState::pending};
    std::uint32_t retries{0};
    std::error_code error;
};

// One byte range of a task. Counters are written by its single worker and
// read concurrently by the task's monitor and query callers.
class Segment {
public:
    explicit Segment(const SegmentSpec& spec, std::uint64_t downloaded = 0) noexcept;

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept;
    [[nodiscard]] SegmentSpec spec() const noexcept { return {index_, offset_, length()}; }

    // Unknown-length segment learned its size at EOF
    void set_length(std::uint64_t length) noexcept {
        length_.store(length, std::memory_order_release);
    }

    [[nodiscard]] std::uint64_t downloaded() const noexcept {
        return downloaded_.load(std::memory_order_acquire);
    }
    void set_downloaded(std::uint64_t bytes) noexcept {
        downloaded_.store(bytes, std::memory_order_release);
    }
    void add_downloaded(std::uint64_t bytes) noexcept {
        downloaded_.fetch_add(bytes, std::memory_order_acq_rel);
    }

    // Next byte to request
    [[nodiscard]] std::uint64_t resume_offset() const noexcept { return offset_ + downloaded(); }

    [[nodiscard]] std::optional<std::uint64_t> remaining() const noexcept;
    [[nodiscard]] bool is_complete() const noexcept;

    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    void state(SegmentState s) noexcept { state_.store(s, std::memory_order_release); }

    [[nodiscard]] std::error_code error() const;
    void error(std::error_code ec);

    [[nodiscard]] std::uint32_t retries() const noexcept { return retries_.load(std::memory_order_relaxed); }
    void add_retry() noexcept { retries_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] SegmentView view() const;

private:
    static constexpr std::uint64_t UNKNOWN_LENGTH = std::numeric_limits<std::uint64_t>::max();

    std::uint32_t index_;
    std::uint64_t offset_;
    std::atomic<std::uint64_t> length_;
    std::atomic<std::uint64_t> downloaded_;
    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint32_t> retries_{0};

    mutable std::mutex error_mutex_;
    std::error_code error_;
};

} // namespace surge::core
