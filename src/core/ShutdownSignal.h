#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

// One-shot, broadcast cancellation flag shared by every worker of a station.
class ShutdownSignal {
public:
    void trigger();
    bool triggered() const { return triggered_.load(std::memory_order_acquire); }

    // Sleeps up to `timeout`; returns true as soon as shutdown is requested.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> triggered_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace core
