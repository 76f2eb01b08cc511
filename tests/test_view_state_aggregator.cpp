#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

#include "app/ViewStateAggregator.h"
#include "core/EventBus.h"
#include "core/EventChannel.h"
#include "core/SnapshotStore.h"

using app::ViewStateAggregator;
using namespace std::chrono_literals;

namespace {

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

domain::EntityUpdate update(const std::string& id, domain::FieldMap fields, bool replace = false) {
    domain::EntityUpdate ev;
    ev.id = id;
    ev.fields = std::move(fields);
    ev.replace = replace;
    return ev;
}

domain::ConnectionStatus status(domain::ConnectionState state,
                                domain::DisconnectReason reason = domain::DisconnectReason::None,
                                std::int64_t retryInMs = 0) {
    domain::ConnectionStatus ev;
    ev.state = state;
    ev.reason = reason;
    ev.retryInMs = retryInMs;
    return ev;
}

}  // namespace

int main() {
    {
        core::EventChannel channel(16);
        core::SnapshotStore store;
        core::EventBus bus;
        ViewStateAggregator aggregator(channel, store, bus);

        aggregator.apply(update("a", {{"px", 1.0}, {"qty", std::int64_t{5}}}));
        const auto first = store.latest();
        aggregator.apply(update("a", {{"px", 2.0}}));
        const auto merged = store.latest();

        if (merged->sequence != 2 || aggregator.processedCount() != 2) {
            std::cerr << "Expected sequence 2 after two events, got " << merged->sequence << "\n";
            return 1;
        }
        const auto& entity = merged->entities->at("a");
        if (std::get<double>(entity.fields.at("px")) != 2.0 || std::get<std::int64_t>(entity.fields.at("qty")) != 5
            || entity.sequence != 2) {
            std::cerr << "Partial update must merge into the existing fields\n";
            return 1;
        }
        if (std::get<double>(first->entities->at("a").fields.at("px")) != 1.0 || first->sequence != 1) {
            std::cerr << "A published snapshot must never change afterwards\n";
            return 1;
        }

        aggregator.apply(update("a", {{"bid", 1.5}}, true));
        const auto replaced = store.latest();
        if (replaced->entities->at("a").fields.size() != 1 || replaced->entities->at("a").fields.count("bid") != 1) {
            std::cerr << "Replacing update must drop fields it does not carry\n";
            return 1;
        }

        aggregator.apply(domain::EntityRemoval{"ghost", {}});
        const auto afterGhost = store.latest();
        if (afterGhost->sequence != 4 || afterGhost->entities.get() != replaced->entities.get()) {
            std::cerr << "Removing an unknown entity must advance the sequence and share the entity map\n";
            return 1;
        }

        aggregator.apply(domain::ErrorNotice{503, "maintenance"});
        if (!store.latest()->lastNotice || store.latest()->lastNotice->code != 503
            || store.latest()->entities.get() != replaced->entities.get()) {
            std::cerr << "Error notice must be recorded without copying entities\n";
            return 1;
        }

        aggregator.apply(domain::EntityRemoval{"a", {}});
        if (!store.latest()->entities->empty() || replaced->entities->count("a") != 1) {
            std::cerr << "Removal must produce a new map and leave older snapshots intact\n";
            return 1;
        }
    }

    {
        core::EventChannel channel(16);
        core::SnapshotStore store;
        core::EventBus bus;
        ViewStateAggregator aggregator(channel, store, bus);

        aggregator.apply(update("a", {{"px", 1.0}}));
        if (!store.latest()->stale) {
            std::cerr << "Snapshot must stay stale until the connection is live\n";
            return 1;
        }

        aggregator.apply(status(domain::ConnectionState::Connected));
        const auto live = store.latest();
        if (live->stale || live->connection != domain::ConnectionState::Connected) {
            std::cerr << "Connected status must clear the stale flag\n";
            return 1;
        }

        aggregator.apply(status(domain::ConnectionState::Backoff, domain::DisconnectReason::ConnectFailed, 800));
        const auto backoff = store.latest();
        if (!backoff->stale || backoff->connection != domain::ConnectionState::Backoff
            || backoff->lastReason != domain::DisconnectReason::ConnectFailed || backoff->entities->size() != 1) {
            std::cerr << "Backoff must mark the view stale while keeping the last known entities\n";
            return 1;
        }
        if (backoff->retryAtMs != backoff->generatedAtMs + 800) {
            std::cerr << "Expected the retry time to be derived from the status delay\n";
            return 1;
        }

        aggregator.apply(domain::Heartbeat{123});
        if (store.latest()->lastHeartbeatMs != 123) {
            std::cerr << "Heartbeat must record its timestamp\n";
            return 1;
        }
    }

    {
        core::EventChannel channel(4096);
        core::SnapshotStore store;
        core::EventBus bus;
        std::atomic<int> notifications{0};
        auto subscription = bus.subscribeSnapshotPublished(
            [&](const core::EventBus::SnapshotPublished&) { notifications.fetch_add(1); });

        ViewStateAggregator aggregator(channel, store, bus);
        aggregator.start();

        constexpr int kEvents = 1000;
        for (int i = 0; i < kEvents; ++i) {
            channel.push(update("e" + std::to_string(i % 50), {{"i", std::int64_t{i}}}));
        }

        if (!waitForCondition(
                [&]() { return aggregator.processedCount() == kEvents && notifications.load() == kEvents; },
                2000ms)) {
            std::cerr << "Aggregator processed " << aggregator.processedCount() << " of " << kEvents << "\n";
            return 1;
        }
        const auto snapshot = store.latest();
        if (snapshot->sequence != aggregator.processedCount() || store.sequence() != kEvents) {
            std::cerr << "Sequence must equal the number of processed events\n";
            return 1;
        }
        if (snapshot->entities->size() != 50
            || std::get<std::int64_t>(snapshot->entities->at("e49").fields.at("i")) != kEvents - 1) {
            std::cerr << "Events must be applied in channel order\n";
            return 1;
        }
        if (notifications.load() != kEvents) {
            std::cerr << "Expected one notification per published snapshot, got " << notifications.load() << "\n";
            return 1;
        }
        if (!bus.consumeChanged() || bus.consumeChanged()) {
            std::cerr << "Changed flag must be consumed exactly once\n";
            return 1;
        }

        channel.push(update("tail", {{"x", true}}));
        aggregator.stop();
        if (aggregator.isRunning() || store.latest()->entities->count("tail") != 1) {
            std::cerr << "Stop must drain queued events before returning\n";
            return 1;
        }
    }

    {
        // a listener that throws does not stop publication or starve later listeners
        core::EventChannel channel(64);
        core::SnapshotStore store;
        core::EventBus bus;
        std::atomic<int> thrown{0};
        std::atomic<int> notifications{0};
        auto failing = bus.subscribeSnapshotPublished([&](const core::EventBus::SnapshotPublished&) {
            thrown.fetch_add(1);
            throw std::runtime_error("redraw hook failed");
        });
        auto counting = bus.subscribeSnapshotPublished(
            [&](const core::EventBus::SnapshotPublished&) { notifications.fetch_add(1); });

        ViewStateAggregator aggregator(channel, store, bus);
        aggregator.start();

        constexpr int kEvents = 20;
        for (int i = 0; i < kEvents; ++i) {
            channel.push(update("e" + std::to_string(i), {{"i", std::int64_t{i}}}));
        }

        if (!waitForCondition(
                [&]() { return aggregator.processedCount() == kEvents && notifications.load() == kEvents; },
                2000ms)) {
            std::cerr << "Aggregator stopped after a listener threw, processed " << aggregator.processedCount()
                      << " of " << kEvents << "\n";
            return 1;
        }
        if (!aggregator.isRunning() || store.sequence() != kEvents || store.latest()->entities->size() != kEvents) {
            std::cerr << "Every event must still be published while a listener throws\n";
            return 1;
        }
        if (thrown.load() != kEvents || notifications.load() != kEvents) {
            std::cerr << "Expected every listener to run for every snapshot, got " << thrown.load() << " and "
                      << notifications.load() << "\n";
            return 1;
        }
        aggregator.stop();
    }

    return 0;
}
