// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>

namespace surge::core {

// Counting semaphore bounding open HTTP connections across every task.
// Capacity 0 means unlimited.
class ConnectionLimiter {
public:
    // Held for the duration of one HTTP transfer
    class Slot {
    public:
        Slot() = default;
        explicit Slot(ConnectionLimiter* owner) noexcept : owner_(owner) {}
        ~Slot() { release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        void release() noexcept;

    private:
        ConnectionLimiter* owner_{nullptr};
    };

    explicit ConnectionLimiter(std::uint32_t capacity) noexcept : capacity_(capacity) {}

    ConnectionLimiter(const ConnectionLimiter&) = delete;
    ConnectionLimiter& operator=(const ConnectionLimiter&) = delete;

    // Blocks until a slot frees up; nullopt when stop is requested first
    [[nodiscard]] std::optional<Slot> acquire(std::stop_token stop);

    [[nodiscard]] std::optional<Slot> try_acquire();

    [[nodiscard]] std::uint32_t in_use() const;
    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }

private:
    void release_one() noexcept;

    const std::uint32_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::uint32_t in_use_{0};
};

} // namespace surge::core
