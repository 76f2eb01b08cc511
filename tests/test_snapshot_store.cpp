#include <atomic>
#include <iostream>
#include <memory>
#include <thread>
#include <variant>
#include <vector>

#include "core/SnapshotStore.h"

using core::SnapshotStore;
using core::ViewSnapshot;

namespace {

// Every entity carries the sequence of the snapshot that produced it, so a
// reader can detect a snapshot assembled from two different writes.
std::shared_ptr<const ViewSnapshot> makeSnapshot(std::uint64_t sequence) {
    auto entities = std::make_shared<core::EntityMap>();
    for (const char* id : {"alpha", "beta", "gamma", "delta"}) {
        core::EntityState entity;
        entity.id = id;
        entity.sequence = sequence;
        entity.fields["seq"] = static_cast<std::int64_t>(sequence);
        entities->emplace(id, std::move(entity));
    }
    auto snapshot = std::make_shared<ViewSnapshot>();
    snapshot->entities = std::move(entities);
    snapshot->sequence = sequence;
    snapshot->stale = false;
    return snapshot;
}

}  // namespace

int main() {
    {
        SnapshotStore store;
        const auto initial = store.latest();
        if (!initial || initial->sequence != 0 || !initial->stale || !initial->entities
            || !initial->entities->empty() || initial->connection != domain::ConnectionState::Disconnected) {
            std::cerr << "Expected an empty, stale, disconnected bootstrap snapshot\n";
            return 1;
        }

        if (!store.publish(makeSnapshot(1)) || store.sequence() != 1) {
            std::cerr << "Expected sequence 1 to be accepted\n";
            return 1;
        }
        if (store.publish(makeSnapshot(1)) || store.publish(makeSnapshot(0)) || store.publish(nullptr)) {
            std::cerr << "Store must reject null and non-increasing snapshots\n";
            return 1;
        }
        if (store.latest()->sequence != 1) {
            std::cerr << "Rejected publish must not replace the current snapshot\n";
            return 1;
        }
        if (!store.publish(makeSnapshot(5)) || store.latest()->sequence != 5) {
            std::cerr << "Gaps in the sequence are allowed\n";
            return 1;
        }
    }

    {
        SnapshotStore store;
        constexpr std::uint64_t kWrites = 20000;
        std::atomic<bool> done{false};
        std::atomic<bool> torn{false};
        std::atomic<bool> wentBack{false};

        std::vector<std::thread> readers;
        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&]() {
                std::uint64_t last = 0;
                while (!done.load(std::memory_order_acquire)) {
                    const auto snapshot = store.latest();
                    if (snapshot->sequence < last) {
                        wentBack.store(true);
                    }
                    last = snapshot->sequence;
                    for (const auto& [id, entity] : *snapshot->entities) {
                        const auto* seq = std::get_if<std::int64_t>(&entity.fields.at("seq"));
                        if (entity.sequence != snapshot->sequence || !seq
                            || static_cast<std::uint64_t>(*seq) != snapshot->sequence) {
                            torn.store(true);
                        }
                    }
                }
            });
        }

        for (std::uint64_t seq = 1; seq <= kWrites; ++seq) {
            store.publish(makeSnapshot(seq));
        }
        done.store(true, std::memory_order_release);
        for (auto& reader : readers) {
            reader.join();
        }

        if (torn.load()) {
            std::cerr << "Reader observed a snapshot mixing two writes\n";
            return 1;
        }
        if (wentBack.load()) {
            std::cerr << "Reader observed the sequence going backwards\n";
            return 1;
        }
        if (store.sequence() != kWrites) {
            std::cerr << "Expected final sequence " << kWrites << " got " << store.sequence() << "\n";
            return 1;
        }
    }

    return 0;
}
