// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/progress_aggregator.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <vector>

namespace surge::core {

ProgressAggregator::ProgressAggregator(std::optional<std::uint64_t> total_bytes,
                                       std::chrono::milliseconds speed_window,
                                       std::chrono::milliseconds publish_interval)
    : speed_window_(speed_window)
    , publish_interval_(publish_interval)
    , total_bytes_(total_bytes) {}

void ProgressAggregator::rewind(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    auto current = downloaded_.load(std::memory_order_relaxed);
    while (!downloaded_.compare_exchange_weak(current, current >= bytes ? current - bytes : 0,
                                              std::memory_order_relaxed)) {
    }
    // Samples before the rewind would yield a negative rate
    samples_.clear();
}

void ProgressAggregator::reset(std::uint64_t baseline) {
    std::lock_guard lock(mutex_);
    downloaded_.store(baseline, std::memory_order_relaxed);
    samples_.clear();
    last_publish_.reset();
}

void ProgressAggregator::set_total(std::optional<std::uint64_t> total_bytes) {
    std::lock_guard lock(mutex_);
    total_bytes_ = total_bytes;
}

void ProgressAggregator::sample(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    sample_locked(now);
}

void ProgressAggregator::sample_locked(Clock::time_point now) {
    samples_.push_back(Sample{now, downloaded_.load(std::memory_order_relaxed)});

    // Keep the newest sample at or before the window start as the baseline
    const auto window_start = now - speed_window_;
    while (samples_.size() > 2 && samples_[1].time <= window_start) {
        samples_.pop_front();
    }
}

ProgressSnapshot ProgressAggregator::snapshot(Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    return snapshot_locked(now);
}

ProgressSnapshot ProgressAggregator::snapshot_locked(Clock::time_point now) const {
    ProgressSnapshot snap;
    snap.downloaded_bytes = downloaded_.load(std::memory_order_relaxed);
    snap.total_bytes = total_bytes_;
    snap.timestamp = now;

    if (samples_.size() >= 2) {
        const auto& first = samples_.front();
        const auto& last = samples_.back();
        auto dt = std::chrono::duration<double>(last.time - first.time).count();
        if (dt > 0.0 && last.bytes >= first.bytes) {
            snap.speed_bps = static_cast<double>(last.bytes - first.bytes) / dt;
        }
    }

    if (snap.speed_bps > 0.0 && snap.total_bytes) {
        auto remaining = *snap.total_bytes > snap.downloaded_bytes
            ? *snap.total_bytes - snap.downloaded_bytes
            : 0;
        auto secs = std::ceil(static_cast<double>(remaining) / snap.speed_bps);
        snap.eta = std::chrono::seconds(static_cast<std::int64_t>(secs));
    }
    return snap;
}

bool ProgressAggregator::tick(Clock::time_point now) {
    ProgressSnapshot snap;
    {
        std::lock_guard lock(mutex_);
        sample_locked(now);
        if (last_publish_ && now - *last_publish_ < publish_interval_) {
            return false;
        }
        last_publish_ = now;
        snap = snapshot_locked(now);
        last_snapshot_ = snap;
    }
    publish(snap);
    return true;
}

void ProgressAggregator::publish_now(Clock::time_point now) {
    ProgressSnapshot snap;
    {
        std::lock_guard lock(mutex_);
        sample_locked(now);
        last_publish_ = now;
        snap = snapshot_locked(now);
        last_snapshot_ = snap;
    }
    publish(snap);
}

std::optional<ProgressSnapshot> ProgressAggregator::last_published() const {
    std::lock_guard lock(mutex_);
    return last_snapshot_;
}

SubscriptionId ProgressAggregator::subscribe(ProgressCallback callback) {
    std::lock_guard lock(subscribers_mutex_);
    auto id = next_subscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void ProgressAggregator::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.erase(id);
}

void ProgressAggregator::publish(const ProgressSnapshot& snap) {
    // Copy so callbacks run unlocked and may unsubscribe
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(subscribers_mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, cb] : subscribers_) {
            callbacks.push_back(cb);
        }
    }
    for (const auto& cb : callbacks) {
        try {
            cb(snap);
        } catch (const std::exception& e) {
            spdlog::error("Progress subscriber threw: {}", e.what());
        }
    }
}

} // namespace surge::core
