#pragma once

#include "core/LogUtils.h"
#include "domain/Messages.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace core {

// Bounded FIFO from the network thread to the aggregator.
// When full, the oldest droppable event is discarded to make room. Heartbeats
// and connection status events are never dropped; they are admitted even above
// capacity when nothing else can be evicted.
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false once the channel is closed.
    bool push(domain::InboundEvent event);
    // Blocks up to `timeout`. Empty result on timeout or when closed and drained.
    std::optional<domain::InboundEvent> pop(std::chrono::milliseconds timeout);
    void close();

    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::uint64_t droppedCount() const { return dropped_.load(std::memory_order_relaxed); }

    static bool droppable(const domain::InboundEvent& event);

private:
    void recordDrop_(const domain::InboundEvent& victim);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<domain::InboundEvent> queue_;
    bool closed_{false};
    std::atomic<std::uint64_t> dropped_{0};
    LogRateLimiter dropLog_{std::chrono::milliseconds(1000)};
};

}  // namespace core
