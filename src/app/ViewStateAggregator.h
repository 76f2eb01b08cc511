#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "core/EventBus.h"
#include "core/EventChannel.h"
#include "core/SnapshotStore.h"
#include "core/ViewSnapshot.h"
#include "domain/Messages.h"

namespace app {

// Applies inbound events in channel order on its own thread. Each event yields a
// new immutable snapshot (copy-on-write of the entity map when entities change)
// with the next sequence number, published to the store and announced on the bus.
class ViewStateAggregator {
public:
    ViewStateAggregator(core::EventChannel& events, core::SnapshotStore& store, core::EventBus& bus);
    ~ViewStateAggregator();

    ViewStateAggregator(const ViewStateAggregator&) = delete;
    ViewStateAggregator& operator=(const ViewStateAggregator&) = delete;

    void start();
    // Closes the event channel and returns once the remaining events are applied.
    void stop();
    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    // Synchronous path used by the worker loop. Single caller at a time.
    domain::Sequence apply(const domain::InboundEvent& event);
    std::uint64_t processedCount() const noexcept { return processed_.load(std::memory_order_acquire); }

private:
    void run_();

    core::EventChannel& events_;
    core::SnapshotStore& store_;
    core::EventBus& bus_;

    std::shared_ptr<const core::ViewSnapshot> current_;
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
    std::thread worker_;
};

}  // namespace app
