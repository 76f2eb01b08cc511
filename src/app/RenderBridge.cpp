#include "app/RenderBridge.h"

#include <utility>

#include "common/Metrics.h"
#include "infra/net/ConnectionManager.h"
#include "logging/Log.h"

namespace app {

RenderBridge::RenderBridge(core::SnapshotStore& store,
                           core::EventBus& bus,
                           core::CommandQueue& commands,
                           const infra::net::ConnectionManager& connection)
    : store_(store), bus_(bus), commands_(commands), connection_(connection) {
    subscription_ = bus_.subscribeSnapshotPublished([this](const core::EventBus::SnapshotPublished&) {
        RedrawCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = redraw_;
        }
        if (callback) {
            callback();
        }
    });
}

std::shared_ptr<const core::ViewSnapshot> RenderBridge::latestSnapshot() const {
    auto snapshot = store_.latest();
    return snapshot ? snapshot : core::ViewSnapshot::bootstrap();
}

void RenderBridge::sendCommand(domain::OutboundCommand command) {
    const auto state = connection_.state();
    if (state != domain::ConnectionState::Connected) {
        dropCommand_(command, domain::toString(state));
        return;
    }
    if (!commands_.tryPush(command)) {
        dropCommand_(command, "queue full");
        return;
    }
    LOG_TRACE(logging::LogCategory::BRIDGE, "queued command %s", domain::commandName(command));
}

bool RenderBridge::consumeDirty() {
    return bus_.consumeChanged();
}

void RenderBridge::setRedrawCallback(RedrawCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    redraw_ = std::move(callback);
}

domain::ConnectionState RenderBridge::connectionState() const {
    return connection_.state();
}

void RenderBridge::dropCommand_(const domain::OutboundCommand& command, const char* why) {
    vst::common::metrics::Registry::instance().incrementCounter(vst::common::metrics::names::kCommandsDropped);
    LOG_WARN(logging::LogCategory::BRIDGE, "dropped command %s: %s", domain::commandName(command), why);
}

}  // namespace app
