#pragma once

#include "domain/Messages.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace core {

// Bounded, non-blocking queue from the GUI to the network thread.
class CommandQueue {
public:
    explicit CommandQueue(std::size_t capacity);

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // False when full or closed; the command is not queued.
    bool tryPush(domain::OutboundCommand command);
    std::vector<domain::OutboundCommand> drain();
    // Discards everything queued and returns how many commands were lost.
    std::size_t clear();
    void close();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<domain::OutboundCommand> queue_;
    bool closed_{false};
};

}  // namespace core
