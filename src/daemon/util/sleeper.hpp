#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// A sleep that shutdown can cut short.
class Sleeper {
public:
    // False when interrupted before the duration elapsed.
    bool sleep_for(std::chrono::milliseconds d) {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, d, [this] { return interrupted_; });
    }

    void interrupt() {
        {
            std::lock_guard lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard lock(mutex_);
        interrupted_ = false;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool interrupted_ = false;
};
