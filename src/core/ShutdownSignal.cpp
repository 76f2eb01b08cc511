#include "core/ShutdownSignal.h"

namespace core {

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return triggered_.load(std::memory_order_acquire); });
}

}  // namespace core
