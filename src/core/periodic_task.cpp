#include "core/periodic_task.hpp"
#include "core/utils.hpp"

#include <format>

namespace litesync {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        run_loop(std::move(stop));
    });
    utils::log::info(std::format("{} started: every {}ms", name_, interval_.count()));
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    utils::log::info(std::format("{} stopped", name_));
}

void PeriodicTask::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Wakes early when stop is requested
            wake_cv_.wait_for(lock, stop, interval_, [] { return false; });
        }
        if (stop.stop_requested()) break;

        try {
            callback_();
        } catch (const std::exception& e) {
            utils::log::error(std::format("{} run failed: {}", name_, e.what()));
        }
    }
}

} // namespace litesync
