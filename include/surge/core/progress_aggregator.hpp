// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace surge::core {

// Immutable progress value handed to subscribers
struct ProgressSnapshot {
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    double speed_bps{0.0};                        // Smoothed over the speed window
    std::optional<std::chrono::seconds> eta;      // Unknown while speed is 0 or total unknown
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] std::optional<double> percent() const noexcept {
        if (!total_bytes) return std::nullopt;
        if (*total_bytes == 0) return 100.0;
        return static_cast<double>(downloaded_bytes) * 100.0 / static_cast<double>(*total_bytes);
    }
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;
using SubscriptionId = std::uint64_t;

// Collects byte deltas from every worker of a task and publishes rate-limited
// snapshots. record() is lock-free; sampling and publishing take the mutex.
// The owner drives tick() from its monitor loop; callbacks run on that thread.
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressAggregator(std::optional<std::uint64_t> total_bytes = std::nullopt,
                                std::chrono::milliseconds speed_window = SPEED_WINDOW,
                                std::chrono::milliseconds publish_interval = PUBLISH_INTERVAL);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Called by workers for every chunk written
    void record(std::uint64_t bytes) noexcept {
        downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    }

    // A worker threw away bytes it had reported (restart from zero)
    void rewind(std::uint64_t bytes);

    // Start counting from an already-downloaded baseline (resume)
    void reset(std::uint64_t baseline);

    void set_total(std::optional<std::uint64_t> total_bytes);

    [[nodiscard]] std::uint64_t downloaded() const noexcept {
        return downloaded_.load(std::memory_order_relaxed);
    }

    // Record a (time, bytes) sample for the speed window
    void sample(Clock::time_point now);

    [[nodiscard]] ProgressSnapshot snapshot(Clock::time_point now) const;

    // Sample, then publish if publish_interval has elapsed since the last publish.
    // Returns true when subscribers were notified.
    bool tick(Clock::time_point now);

    // Sample and publish regardless of the interval (state changes, completion)
    void publish_now(Clock::time_point now);

    SubscriptionId subscribe(ProgressCallback callback);
    void unsubscribe(SubscriptionId id);

    [[nodiscard]] std::optional<ProgressSnapshot> last_published() const;

private:
    struct Sample {
        Clock::time_point time;
        std::uint64_t bytes;
    };

    void sample_locked(Clock::time_point now);
    [[nodiscard]] ProgressSnapshot snapshot_locked(Clock::time_point now) const;
    void publish(const ProgressSnapshot& snap);

    std::atomic<std::uint64_t> downloaded_{0};
    const std::chrono::milliseconds speed_window_;
    const std::chrono::milliseconds publish_interval_;

    mutable std::mutex mutex_;
    std::optional<std::uint64_t> total_bytes_;
    std::deque<Sample> samples_;
    std::optional<Clock::time_point> last_publish_;
    std::optional<ProgressSnapshot> last_snapshot_;

    mutable std::mutex subscribers_mutex_;
    std::map<SubscriptionId, ProgressCallback> subscribers_;
    SubscriptionId next_subscription_{1};
};

} // namespace surge::core
