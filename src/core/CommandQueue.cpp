#include "core/CommandQueue.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace core {

CommandQueue::CommandQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool CommandQueue::tryPush(domain::OutboundCommand command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || queue_.size() >= capacity_) {
        return false;
    }
    queue_.push_back(std::move(command));
    return true;
}

std::vector<domain::OutboundCommand> CommandQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::OutboundCommand> drained;
    drained.reserve(queue_.size());
    std::move(queue_.begin(), queue_.end(), std::back_inserter(drained));
    queue_.clear();
    return drained;
}

std::size_t CommandQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t count = queue_.size();
    queue_.clear();
    return count;
}

void CommandQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    queue_.clear();
}

std::size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace core
