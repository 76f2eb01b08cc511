#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "core/CommandQueue.h"
#include "core/EventBus.h"
#include "core/SnapshotStore.h"
#include "core/ViewSnapshot.h"
#include "domain/Messages.h"

namespace infra::net {
class ConnectionManager;
}

namespace app {

// The GUI's only contact point with the core. Every call returns immediately.
class RenderBridge {
public:
    using RedrawCallback = std::function<void()>;

    RenderBridge(core::SnapshotStore& store,
                 core::EventBus& bus,
                 core::CommandQueue& commands,
                 const infra::net::ConnectionManager& connection);

    RenderBridge(const RenderBridge&) = delete;
    RenderBridge& operator=(const RenderBridge&) = delete;

    std::shared_ptr<const core::ViewSnapshot> latestSnapshot() const;
    // Dropped (and logged) when the connection is not Connected or the queue is full.
    void sendCommand(domain::OutboundCommand command);
    // True once per newly published snapshot.
    bool consumeDirty();
    // Runs on the aggregator thread after each publish; must not block.
    void setRedrawCallback(RedrawCallback callback);
    domain::ConnectionState connectionState() const;

private:
    void dropCommand_(const domain::OutboundCommand& command, const char* why);

    core::SnapshotStore& store_;
    core::EventBus& bus_;
    core::CommandQueue& commands_;
    const infra::net::ConnectionManager& connection_;

    std::mutex callbackMutex_;
    RedrawCallback redraw_;
    core::EventBus::Subscription subscription_;
};

}  // namespace app
