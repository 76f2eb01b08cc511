#include "core/EventBus.h"

#include <exception>
#include <utility>

#include "logging/Log.h"

namespace core {

EventBus::Subscription::Subscription(EventBus* bus, std::size_t id)
    : bus_(bus), id_(id) {}

EventBus::Subscription::~Subscription() {
    reset();
}

EventBus::Subscription::Subscription(Subscription&& other) noexcept {
    bus_ = other.bus_;
    id_ = other.id_;
    other.bus_ = nullptr;
    other.id_ = 0;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (bus_ && id_ != 0) {
        bus_->unsubscribe(id_);
    }
    bus_ = nullptr;
    id_ = 0;
}

EventBus::Subscription EventBus::subscribeSnapshotPublished(SnapshotPublishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t id = nextId_++;
    listeners_.push_back(CallbackData{id, std::move(callback)});
    return Subscription(this, id);
}

void EventBus::unsubscribe(std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t idx = 0; idx < listeners_.size(); ++idx) {
        if (listeners_[idx].id == id) {
            if (idx + 1 != listeners_.size()) {
                listeners_[idx] = std::move(listeners_.back());
            }
            listeners_.pop_back();
            break;
        }
    }
}

void EventBus::publishSnapshot(const SnapshotPublished& event) {
    changed_.exchange(true, std::memory_order_acq_rel);

    std::vector<SnapshotPublishedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(listeners_.size());
        for (const auto& listener : listeners_) {
            if (listener.callback) {
                callbacks.push_back(listener.callback);
            }
        }
    }
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::VIEW,
                      "snapshot listener failed sequence=%llu: %s",
                      static_cast<unsigned long long>(event.sequence),
                      ex.what());
        }
    }
}

bool EventBus::consumeChanged() {
    return changed_.exchange(false, std::memory_order_acq_rel);
}

}  // namespace core
