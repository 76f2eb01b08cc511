#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include "common/Metrics.h"
#include "core/EventChannel.h"

using core::EventChannel;
using namespace std::chrono_literals;

namespace {

domain::EntityUpdate update(const std::string& id) {
    domain::EntityUpdate ev;
    ev.id = id;
    ev.fields["px"] = 1.0;
    return ev;
}

std::string idOf(const domain::InboundEvent& event) {
    if (const auto* up = std::get_if<domain::EntityUpdate>(&event)) {
        return up->id;
    }
    return {};
}

}  // namespace

int main() {
    auto& registry = vst::common::metrics::Registry::instance();
    const auto droppedBefore = registry.snapshot().counter(vst::common::metrics::names::kEventsDropped);

    {
        // overflow evicts the oldest droppable event
        EventChannel channel(3);
        channel.push(update("a"));
        channel.push(update("b"));
        channel.push(update("c"));
        channel.push(update("d"));

        if (channel.size() != 3 || channel.droppedCount() != 1) {
            std::cerr << "Expected size 3 and one drop, got size=" << channel.size()
                      << " dropped=" << channel.droppedCount() << "\n";
            return 1;
        }
        const auto first = channel.pop(10ms);
        if (!first || idOf(*first) != "b") {
            std::cerr << "Expected the oldest event to be evicted\n";
            return 1;
        }
    }

    {
        // heartbeats and connection status are never evicted
        EventChannel channel(2);
        channel.push(domain::Heartbeat{1});
        channel.push(update("a"));
        channel.push(domain::ConnectionStatus{});

        if (channel.size() != 2 || channel.droppedCount() != 1) {
            std::cerr << "Expected the update to be evicted in favour of the status event\n";
            return 1;
        }
        const auto first = channel.pop(10ms);
        const auto second = channel.pop(10ms);
        if (!first || !second || !std::holds_alternative<domain::Heartbeat>(*first)
            || !std::holds_alternative<domain::ConnectionStatus>(*second)) {
            std::cerr << "Exempt events must survive overflow in order\n";
            return 1;
        }
    }

    {
        // only exempt events queued: droppable newcomers give way, exempt ones exceed capacity
        EventChannel channel(2);
        channel.push(domain::Heartbeat{1});
        channel.push(domain::Heartbeat{2});
        channel.push(update("late"));
        if (channel.size() != 2 || channel.droppedCount() != 1) {
            std::cerr << "Expected the droppable newcomer to be discarded\n";
            return 1;
        }
        channel.push(domain::ConnectionStatus{});
        if (channel.size() != 3 || channel.droppedCount() != 1) {
            std::cerr << "Expected the status event to be admitted above capacity\n";
            return 1;
        }
    }

    {
        const auto droppedAfter = registry.snapshot().counter(vst::common::metrics::names::kEventsDropped);
        if (droppedAfter - droppedBefore != 3) {
            std::cerr << "Expected events_dropped_total to grow by 3, grew by " << (droppedAfter - droppedBefore)
                      << "\n";
            return 1;
        }
    }

    {
        EventChannel channel(8);
        const auto start = std::chrono::steady_clock::now();
        if (channel.pop(30ms)) {
            std::cerr << "Empty channel must time out\n";
            return 1;
        }
        if (std::chrono::steady_clock::now() - start < 25ms) {
            std::cerr << "pop returned before its timeout\n";
            return 1;
        }

        channel.push(update("x"));
        channel.close();
        if (channel.push(update("y"))) {
            std::cerr << "Closed channel must refuse new events\n";
            return 1;
        }
        const auto remaining = channel.pop(10ms);
        if (!remaining || idOf(*remaining) != "x") {
            std::cerr << "Closed channel must still hand out queued events\n";
            return 1;
        }
        if (channel.pop(10ms)) {
            std::cerr << "Drained closed channel must return empty\n";
            return 1;
        }
    }

    {
        // FIFO across threads
        EventChannel channel(10000);
        constexpr int kCount = 5000;
        std::thread producer([&]() {
            for (int i = 0; i < kCount; ++i) {
                channel.push(update(std::to_string(i)));
            }
        });

        int expected = 0;
        bool inOrder = true;
        while (expected < kCount) {
            auto event = channel.pop(1000ms);
            if (!event) {
                break;
            }
            if (idOf(*event) != std::to_string(expected)) {
                inOrder = false;
            }
            ++expected;
        }
        producer.join();

        if (!inOrder || expected != kCount) {
            std::cerr << "Expected " << kCount << " events in order, received " << expected << "\n";
            return 1;
        }
    }

    return 0;
}
