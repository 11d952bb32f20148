#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "common/debug.h"

namespace concurrency {

// Runs `fn` every `interval` on its own thread until stop().
// stop() wakes the sleeping thread instead of waiting out the interval.
class PeriodicTask {
public:
    using Fn = std::function<void()>;

    PeriodicTask(std::chrono::milliseconds interval, Fn fn)
        : interval_(interval), fn_(std::move(fn)) {}

    virtual ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    bool start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) return false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = false;
        }
        thread_ = std::thread(&PeriodicTask::loop, this);
        return true;
    }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool running() const { return running_.load(std::memory_order_acquire); }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
            lock.unlock();
            try {
                fn_();
            } catch (const std::exception& e) {
                error_cpp20(std::string("periodic task failed: ") + e.what());
            }
            lock.lock();
        }
    }

    const std::chrono::milliseconds interval_;
    Fn fn_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::thread thread_{};
};

} // namespace concurrency
