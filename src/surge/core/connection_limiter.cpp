// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/connection_limiter.hpp>

namespace surge::core {

void ConnectionLimiter::Slot::release() noexcept {
    if (owner_) {
        owner_->release_one();
        owner_ = nullptr;
    }
}

std::optional<ConnectionLimiter::Slot> ConnectionLimiter::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    bool got = cv_.wait(lock, stop, [this] {
        return capacity_ == 0 || in_use_ < capacity_;
    });
    if (!got) {
        return std::nullopt;
    }
    ++in_use_;
    return Slot(this);
}

std::optional<ConnectionLimiter::Slot> ConnectionLimiter::try_acquire() {
    std::lock_guard lock(mutex_);
    if (capacity_ != 0 && in_use_ >= capacity_) {
        return std::nullopt;
    }
    ++in_use_;
    return Slot(this);
}

std::uint32_t ConnectionLimiter::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

void ConnectionLimiter::release_one() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

} // namespace surge::core
