#pragma once
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>

namespace planner_injector {

// One-shot gate owned by the host. Once opened it stays open. Waiters
// bring their own stop flag; wake_waiters() nudges them to re-check it
// without touching the gate itself.
class ReadinessGate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            opened_ = true;
        }
        cv_.notify_all();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    // Call after setting a waiter's stop flag.
    void wake_waiters() {
        // Taking the lock orders the flag store before any waiter's re-check
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
    }

    // True if the gate is open when this returns.
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout, const std::atomic<bool>& stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this, &stop] { return opened_ || stop.load(); });
        return opened_;
    }

    // Sleeps for up to timeout; true if stop was raised meanwhile.
    template<typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> timeout, const std::atomic<bool>& stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&stop] { return stop.load(); });
        return stop.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool opened_ = false;
};

} // namespace planner_injector
