#include "app/ViewStateAggregator.h"

#include <chrono>
#include <type_traits>
#include <utility>

#include "common/Metrics.h"
#include "logging/Log.h"

namespace app {
namespace {
constexpr std::chrono::milliseconds kPopTimeout{100};

domain::TimestampMs eventTime(domain::TimestampMs wireTime) {
    return wireTime > 0 ? wireTime : domain::nowMs();
}
}  // namespace

ViewStateAggregator::ViewStateAggregator(core::EventChannel& events,
                                         core::SnapshotStore& store,
                                         core::EventBus& bus)
    : events_(events), store_(store), bus_(bus), current_(store.latest()) {}

ViewStateAggregator::~ViewStateAggregator() {
    stop();
}

void ViewStateAggregator::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (worker_.joinable()) {
        return;
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&ViewStateAggregator::run_, this);
}

void ViewStateAggregator::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!worker_.joinable()) {
        return;
    }
    events_.close();
    worker_.join();
}

void ViewStateAggregator::run_() {
    LOG_INFO(logging::LogCategory::VIEW, "ViewStateAggregator thread starting");
    try {
        while (true) {
            auto event = events_.pop(kPopTimeout);
            if (!event) {
                if (events_.closed()) {
                    break;
                }
                continue;
            }
            try {
                apply(*event);
            }
            catch (const std::exception& ex) {
                LOG_ERROR(logging::LogCategory::VIEW,
                          "ViewStateAggregator skipped %s event: %s",
                          domain::eventName(*event),
                          ex.what());
            }
        }
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::VIEW, "ViewStateAggregator thread failed: %s", ex.what());
    }
    running_.store(false, std::memory_order_release);
    LOG_INFO(logging::LogCategory::VIEW,
             "ViewStateAggregator thread stopping processed=%llu",
             static_cast<unsigned long long>(processedCount()));
}

domain::Sequence ViewStateAggregator::apply(const domain::InboundEvent& event) {
    auto next = std::make_shared<core::ViewSnapshot>(*current_);
    next->sequence = current_->sequence + 1;
    next->generatedAtMs = domain::nowMs();
    next->droppedEvents = events_.droppedCount();

    std::visit(
        [&next](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, domain::EntityUpdate>) {
                auto entities = std::make_shared<core::EntityMap>(*next->entities);
                auto [it, inserted] = entities->try_emplace(ev.id);
                core::EntityState& entity = it->second;
                entity.id = ev.id;
                if (inserted || ev.replace) {
                    entity.fields = ev.fields;
                }
                else {
                    for (const auto& [name, value] : ev.fields) {
                        entity.fields.insert_or_assign(name, value);
                    }
                }
                entity.updatedAtMs = eventTime(ev.timestampMs);
                entity.sequence = next->sequence;
                next->entities = std::move(entities);
            }
            else if constexpr (std::is_same_v<T, domain::EntityRemoval>) {
                if (next->entities->count(ev.id) == 0) {
                    LOG_DEBUG(logging::LogCategory::VIEW, "removal of unknown entity id=%s", ev.id.c_str());
                }
                else {
                    auto entities = std::make_shared<core::EntityMap>(*next->entities);
                    entities->erase(ev.id);
                    next->entities = std::move(entities);
                }
            }
            else if constexpr (std::is_same_v<T, domain::Heartbeat>) {
                next->lastHeartbeatMs = eventTime(ev.timestampMs);
            }
            else if constexpr (std::is_same_v<T, domain::ErrorNotice>) {
                LOG_WARN(logging::LogCategory::VIEW,
                         "backend error code=%lld message=%s",
                         static_cast<long long>(ev.code),
                         ev.message.c_str());
                next->lastNotice = ev;
            }
            else if constexpr (std::is_same_v<T, domain::ConnectionStatus>) {
                next->connection = ev.state;
                next->lastReason = ev.reason;
                next->retryCount = ev.retryCount;
                next->retryAtMs = ev.retryInMs > 0 ? next->generatedAtMs + ev.retryInMs : 0;
                next->stale = ev.state != domain::ConnectionState::Connected;
            }
        },
        event);

    const domain::Sequence sequence = next->sequence;
    const core::EventBus::SnapshotPublished published{sequence, next->stale, next->connection};

    std::shared_ptr<const core::ViewSnapshot> frozen = std::move(next);
    if (!store_.publish(frozen)) {
        LOG_ERROR(logging::LogCategory::VIEW,
                  "snapshot sequence=%llu was not accepted by the store",
                  static_cast<unsigned long long>(sequence));
    }
    current_ = std::move(frozen);
    processed_.fetch_add(1, std::memory_order_acq_rel);

    vst::common::metrics::Registry::instance().setGauge(vst::common::metrics::names::kSnapshotSequence,
                                                        static_cast<double>(sequence));
    bus_.publishSnapshot(published);
    return sequence;
}

}  // namespace app
