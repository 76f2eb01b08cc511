#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace core {

// Lets one message through per interval and counts the ones it held back.
class LogRateLimiter {
public:
    explicit LogRateLimiter(std::chrono::milliseconds minInterval);

    bool allow();
    // Number of suppressed calls since the last allowed one; resets the count.
    std::uint64_t takeSuppressed();

private:
    std::chrono::milliseconds minInterval_;
    std::atomic<std::chrono::steady_clock::time_point> last_;
    std::atomic<std::uint64_t> suppressed_{0};
};

// Same policy keyed by message kind.
class RateLogger {
public:
    struct Decision {
        bool allowed{false};
        std::uint64_t suppressed{0};
    };

    Decision allow(const std::string& key, std::chrono::milliseconds interval);
    void reset(const std::string& key);

private:
    struct Entry {
        std::chrono::steady_clock::time_point nextAllowed{};
        std::uint64_t suppressed{0};
    };

    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace core
