#include "admission/write_rate_limiter.hpp"
#include "core/utils.hpp"
#include <format>

namespace litesync {

WriteRateLimiter::WriteRateLimiter(WriteRateConfig config)
    : config_(config), window_start_(Clock::now()) {}

void WriteRateLimiter::roll_window(Clock::time_point now) {
    if (now - window_start_ >= std::chrono::seconds{1}) {
        window_count_ = 0;
        window_start_ = now;
        warned_this_window_ = false;
    }
}

bool WriteRateLimiter::admit_write() {
    std::unique_lock<std::mutex> lock(mutex_);
    roll_window(Clock::now());

    ++window_count_;
    ++total_writes_;
    if (window_count_ <= config_.max_writes_per_second) {
        return false;
    }

    ++throttled_writes_;
    if (!warned_this_window_) {
        warned_this_window_ = true;
        utils::log::warn(std::format("Write rate over {}/s, throttling writers by {}ms",
            config_.max_writes_per_second, config_.throttle_backoff.count()));
    }

    // Releases the lock while waiting; other writers keep counting
    shutdown_cv_.wait_for(lock, config_.throttle_backoff, [this] { return shutdown_; });
    return true;
}

uint64_t WriteRateLimiter::current_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Clock::now() - window_start_ >= std::chrono::seconds{2}) {
        return 0;
    }
    return window_count_;
}

WriteRateStats WriteRateLimiter::stats() const {
    WriteRateStats s;
    s.current_rate = current_rate();
    std::lock_guard<std::mutex> lock(mutex_);
    s.total_writes = total_writes_;
    s.throttled_writes = throttled_writes_;
    return s;
}

void WriteRateLimiter::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    shutdown_cv_.notify_all();
}

} // namespace litesync
