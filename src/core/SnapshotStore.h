#pragma once

#include "core/ViewSnapshot.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace core {

// Latest-snapshot handle: one writer, any number of lock-free readers.
class SnapshotStore {
public:
    SnapshotStore();

    // Rejects (returns false) a null snapshot or one whose sequence does not
    // exceed the current one, so readers never observe a sequence going back.
    bool publish(std::shared_ptr<const ViewSnapshot> snapshot);
    std::shared_ptr<const ViewSnapshot> latest() const;
    std::uint64_t sequence() const;

private:
    std::shared_ptr<const ViewSnapshot> ptr_;
    std::mutex writeMutex_;
    std::atomic<std::uint64_t> seq_{0};
};

}  // namespace core
