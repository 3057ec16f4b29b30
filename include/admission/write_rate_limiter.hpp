#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace litesync {

struct WriteRateConfig {
    uint32_t max_writes_per_second = 95;
    std::chrono::milliseconds throttle_backoff{10};
};

struct WriteRateStats {
    uint64_t total_writes = 0;
    uint64_t throttled_writes = 0;
    uint64_t current_rate = 0;
};

/**
 * @brief Fixed 1-second window write counter with soft backpressure
 *
 * Writes over the cap are delayed by a fixed backoff, never rejected.
 * The window is a single mutex-guarded counter. The backoff is a wait on a
 * condition variable that releases the mutex, so shutdown() can cut it
 * short.
 */
class WriteRateLimiter {
public:
    explicit WriteRateLimiter(WriteRateConfig config = {});

    /**
     * @brief Count one write; sleeps the backoff if the window is over the cap
     * @return true if the caller was throttled
     */
    bool admit_write();

    /**
     * @brief Writes per second
     *
     * Under 1s into the window: the in-progress count. Between 1s and 2s the
     * window has completed without rolling, so its count is reported as is.
     * From 2s on the window that completed since then saw no writes: 0.
     */
    [[nodiscard]] uint64_t current_rate() const;

    [[nodiscard]] WriteRateStats stats() const;

    [[nodiscard]] uint32_t max_rate() const { return config_.max_writes_per_second; }

    /**
     * @brief Wake throttled callers; later calls no longer sleep
     */
    void shutdown();

private:
    using Clock = std::chrono::steady_clock;

    /// Caller holds mutex_
    void roll_window(Clock::time_point now);

    WriteRateConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable shutdown_cv_;
    Clock::time_point window_start_;
    uint64_t window_count_ = 0;
    bool warned_this_window_ = false;
    bool shutdown_ = false;

    uint64_t total_writes_ = 0;
    uint64_t throttled_writes_ = 0;
};

} // namespace litesync
