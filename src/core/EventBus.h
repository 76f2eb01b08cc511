#pragma once

#include "domain/Types.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace core {

// Redraw notifications. Publishing sets a flag the render loop consumes once
// and invokes listeners on the publishing thread; listeners must not block.
// A listener that throws is logged and skipped.
class EventBus {
public:
    struct SnapshotPublished {
        domain::Sequence sequence{0};
        bool stale{true};
        domain::ConnectionState connection{domain::ConnectionState::Disconnected};
    };

    using SnapshotPublishedCallback = std::function<void(const SnapshotPublished&)>;

    class Subscription {
    public:
        Subscription() = default;
        Subscription(EventBus* bus, std::size_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

    private:
        EventBus* bus_{nullptr};
        std::size_t id_{0};
    };

    Subscription subscribeSnapshotPublished(SnapshotPublishedCallback callback);
    void unsubscribe(std::size_t id);

    void publishSnapshot(const SnapshotPublished& event);
    bool consumeChanged();

private:
    struct CallbackData {
        std::size_t id{};
        SnapshotPublishedCallback callback{};
    };

    std::mutex mutex_;
    std::vector<CallbackData> listeners_;
    std::atomic<bool> changed_{false};
    std::size_t nextId_{1};
};

}  // namespace core
