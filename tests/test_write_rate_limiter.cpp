#include <catch2/catch_test_macros.hpp>
#include "admission/write_rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace litesync;

namespace {

WriteRateConfig config(uint32_t max, std::chrono::milliseconds backoff = std::chrono::milliseconds{10}) {
    WriteRateConfig c;
    c.max_writes_per_second = max;
    c.throttle_backoff = backoff;
    return c;
}

} // anonymous namespace

TEST_CASE("WriteRateLimiter: writes over the cap are delayed, never rejected", "[write_rate]") {
    WriteRateLimiter limiter(config(5, std::chrono::milliseconds{20}));

    for (int i = 0; i < 5; ++i) {
        REQUIRE_FALSE(limiter.admit_write());
    }

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE(limiter.admit_write());
    const auto waited = std::chrono::steady_clock::now() - begin;
    REQUIRE(waited >= std::chrono::milliseconds{15});

    const auto stats = limiter.stats();
    REQUIRE(stats.total_writes == 6);
    REQUIRE(stats.throttled_writes == 1);
    REQUIRE(stats.current_rate == 6);
}

TEST_CASE("WriteRateLimiter: current_rate reports the in-progress window", "[write_rate]") {
    WriteRateLimiter limiter(config(100));
    REQUIRE(limiter.current_rate() == 0);
    limiter.admit_write();
    limiter.admit_write();
    limiter.admit_write();
    REQUIRE(limiter.current_rate() == 3);
}

TEST_CASE("WriteRateLimiter: window rolls after one second", "[write_rate]") {
    WriteRateLimiter limiter(config(2));

    REQUIRE_FALSE(limiter.admit_write());
    REQUIRE_FALSE(limiter.admit_write());
    REQUIRE(limiter.admit_write());

    std::this_thread::sleep_for(std::chrono::milliseconds{1100});

    SECTION("Aged window reports its own completed count") {
        REQUIRE(limiter.current_rate() == 3);
    }

    SECTION("Next write starts a fresh window") {
        REQUIRE_FALSE(limiter.admit_write());
        REQUIRE(limiter.current_rate() == 1);
        REQUIRE_FALSE(limiter.admit_write());
        REQUIRE(limiter.admit_write());
    }
}

TEST_CASE("WriteRateLimiter: after a rollover the aged count is the completed window", "[write_rate]") {
    WriteRateLimiter limiter(config(100));

    for (int i = 0; i < 7; ++i) {
        limiter.admit_write();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1050});

    // Rolls: the busy window above is done, this one holds a single write
    limiter.admit_write();
    std::this_thread::sleep_for(std::chrono::milliseconds{1100});

    REQUIRE(limiter.current_rate() == 1);
}

TEST_CASE("WriteRateLimiter: a full idle second reads as zero", "[write_rate]") {
    WriteRateLimiter limiter(config(100));

    limiter.admit_write();
    limiter.admit_write();
    limiter.admit_write();
    std::this_thread::sleep_for(std::chrono::milliseconds{2100});

    REQUIRE(limiter.current_rate() == 0);
    REQUIRE(limiter.stats().total_writes == 3);
}

TEST_CASE("WriteRateLimiter: shutdown wakes throttled writers", "[write_rate]") {
    WriteRateLimiter limiter(config(1, std::chrono::milliseconds{10000}));
    REQUIRE_FALSE(limiter.admit_write());

    auto throttled = std::async(std::launch::async, [&limiter] {
        return limiter.admit_write();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    limiter.shutdown();

    REQUIRE(throttled.wait_for(std::chrono::seconds{2}) == std::future_status::ready);
    REQUIRE(throttled.get());

    // Later callers over the cap no longer sleep
    const auto begin = std::chrono::steady_clock::now();
    REQUIRE(limiter.admit_write());
    REQUIRE(std::chrono::steady_clock::now() - begin < std::chrono::seconds{1});
}

TEST_CASE("WriteRateLimiter: concurrent writers are all counted", "[write_rate]") {
    WriteRateLimiter limiter(config(1000000));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&limiter] {
            for (int i = 0; i < 250; ++i) {
                limiter.admit_write();
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(limiter.stats().total_writes == 2000);
    REQUIRE(limiter.stats().throttled_writes == 0);
}
