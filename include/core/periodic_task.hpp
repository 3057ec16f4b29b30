#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace litesync {

/**
 * @brief Runs a callback on a background jthread at a fixed interval
 *
 * The first run happens one interval after start(). stop() interrupts the
 * wait immediately and joins; a run already in progress finishes first.
 * Exceptions escaping the callback are logged and the loop keeps going.
 */
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    /**
     * @param name Used in log lines
     * @param interval Delay between the end of one run and the next
     * @param callback Work to run
     */
    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void run_loop(std::stop_token stop);

    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable_any wake_cv_;
    std::jthread thread_;
};

} // namespace litesync
