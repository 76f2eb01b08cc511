#include "core/SnapshotStore.h"

#include <utility>

#include "logging/Log.h"

namespace core {

SnapshotStore::SnapshotStore()
    : ptr_(ViewSnapshot::bootstrap()) {}

bool SnapshotStore::publish(std::shared_ptr<const ViewSnapshot> snapshot) {
    if (!snapshot) {
        return false;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    const auto current = seq_.load(std::memory_order_relaxed);
    if (snapshot->sequence <= current) {
        LOG_WARN(logging::LogCategory::VIEW,
                 "rejected snapshot publish sequence=%llu current=%llu",
                 static_cast<unsigned long long>(snapshot->sequence),
                 static_cast<unsigned long long>(current));
        return false;
    }

    const auto sequence = snapshot->sequence;
    std::atomic_store_explicit(&ptr_, std::move(snapshot), std::memory_order_release);
    seq_.store(sequence, std::memory_order_release);
    return true;
}

std::shared_ptr<const ViewSnapshot> SnapshotStore::latest() const {
    return std::atomic_load_explicit(&ptr_, std::memory_order_acquire);
}

std::uint64_t SnapshotStore::sequence() const {
    return seq_.load(std::memory_order_acquire);
}

}  // namespace core
