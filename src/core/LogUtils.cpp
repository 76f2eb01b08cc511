#include "core/LogUtils.h"

namespace core {

LogRateLimiter::LogRateLimiter(std::chrono::milliseconds minInterval)
    : minInterval_(minInterval), last_(std::chrono::steady_clock::time_point::min()) {}

bool LogRateLimiter::allow() {
    const auto now = std::chrono::steady_clock::now();
    auto prev = last_.load(std::memory_order_relaxed);
    if (prev == std::chrono::steady_clock::time_point::min() || now - prev >= minInterval_) {
        if (last_.compare_exchange_strong(prev, now, std::memory_order_relaxed)) {
            return true;
        }
    }
    suppressed_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

std::uint64_t LogRateLimiter::takeSuppressed() {
    return suppressed_.exchange(0, std::memory_order_relaxed);
}

RateLogger::Decision RateLogger::allow(const std::string& key, std::chrono::milliseconds interval) {
    const auto now = std::chrono::steady_clock::now();
    std::scoped_lock lk(mutex_);
    auto& entry = entries_[key];
    if (now >= entry.nextAllowed) {
        Decision decision{true, entry.suppressed};
        entry.nextAllowed = now + interval;
        entry.suppressed = 0;
        return decision;
    }
    ++entry.suppressed;
    return Decision{false, entry.suppressed};
}

void RateLogger::reset(const std::string& key) {
    std::scoped_lock lk(mutex_);
    entries_.erase(key);
}

}  // namespace core
