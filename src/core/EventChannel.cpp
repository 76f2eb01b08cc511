#include "core/EventChannel.h"

#include <algorithm>
#include <utility>

#include "common/Metrics.h"
#include "logging/Log.h"

namespace core {

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EventChannel::droppable(const domain::InboundEvent& event) {
    return !std::holds_alternative<domain::Heartbeat>(event)
        && !std::holds_alternative<domain::ConnectionStatus>(event);
}

bool EventChannel::push(domain::InboundEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(), [](const domain::InboundEvent& queued) {
                return droppable(queued);
            });
            if (victim != queue_.end()) {
                recordDrop_(*victim);
                queue_.erase(victim);
            }
            else if (droppable(event)) {
                // queue holds only exempt events: the newcomer gives way
                recordDrop_(event);
                return true;
            }
        }

        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<domain::InboundEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); })) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    domain::InboundEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventChannel::recordDrop_(const domain::InboundEvent& victim) {
    const auto total = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
    vst::common::metrics::Registry::instance().incrementCounter(vst::common::metrics::names::kEventsDropped);
    if (dropLog_.allow()) {
        LOG_WARN(logging::LogCategory::CHANNEL,
                 "event channel full capacity=%zu dropped=%s total_dropped=%llu suppressed=%llu",
                 capacity_,
                 domain::eventName(victim),
                 static_cast<unsigned long long>(total),
                 static_cast<unsigned long long>(dropLog_.takeSuppressed()));
    }
}

}  // namespace core
