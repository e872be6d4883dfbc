// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/connection_limiter.hpp>
#include <atomic>
#include <thread>

using namespace surge::core;
using namespace std::chrono_literals;

TEST_CASE("ConnectionLimiter - slots are bounded and released", "[limiter]") {
    ConnectionLimiter limiter(2);

    auto a = limiter.try_acquire();
    auto b = limiter.try_acquire();
    REQUIRE(a);
    REQUIRE(b);
    CHECK(limiter.in_use() == 2);
    CHECK_FALSE(limiter.try_acquire());

    a.reset();
    CHECK(limiter.in_use() == 1);
    CHECK(limiter.try_acquire());
}

TEST_CASE("ConnectionLimiter - zero capacity is unlimited", "[limiter]") {
    ConnectionLimiter limiter(0);
    std::vector<ConnectionLimiter::Slot> slots;
    for (int i = 0; i < 100; ++i) {
        auto slot = limiter.try_acquire();
        REQUIRE(slot);
        slots.push_back(std::move(*slot));
    }
    CHECK(limiter.in_use() == 100);
}

TEST_CASE("ConnectionLimiter - blocked acquire wakes on release", "[limiter]") {
    ConnectionLimiter limiter(1);
    auto held = limiter.try_acquire();
    REQUIRE(held);

    std::atomic<bool> acquired{false};
    std::jthread waiter([&](std::stop_token st) {
        auto slot = limiter.acquire(st);
        acquired = slot.has_value();
    });

    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(acquired.load());
    held.reset();
    waiter.join();
    CHECK(acquired.load());
}

TEST_CASE("ConnectionLimiter - stop request abandons the wait", "[limiter]") {
    ConnectionLimiter limiter(1);
    auto held = limiter.try_acquire();
    REQUIRE(held);

    std::stop_source stop;
    std::atomic<bool> got_slot{true};
    std::jthread waiter([&] {
        got_slot = limiter.acquire(stop.get_token()).has_value();
    });

    std::this_thread::sleep_for(20ms);
    stop.request_stop();
    waiter.join();
    CHECK_FALSE(got_slot.load());
    CHECK(limiter.in_use() == 1);
}
