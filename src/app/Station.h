#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "app/RenderBridge.h"
#include "app/ViewStateAggregator.h"
#include "config/Config.h"
#include "core/CommandQueue.h"
#include "core/EventBus.h"
#include "core/EventChannel.h"
#include "core/ShutdownSignal.h"
#include "core/SnapshotStore.h"
#include "infra/net/ConnectionManager.h"
#include "infra/net/Transport.h"

namespace app {

// Composition root for one station instance: owns the channels, the snapshot
// store, the network and aggregator threads and the bridge handed to the GUI.
class Station {
public:
    // Throws std::invalid_argument when the backend URL cannot be parsed.
    // An empty factory selects the Beast WebSocket transport.
    explicit Station(const config::Config& config, infra::net::TransportFactory transportFactory = {});
    ~Station();

    Station(const Station&) = delete;
    Station& operator=(const Station&) = delete;

    void start();
    // Safe from any thread, including signal handlers run by an io_context.
    void requestShutdown();
    bool shutdownRequested() const { return shutdown_.triggered(); }
    // Requests shutdown, then joins the network and aggregator threads. Idempotent.
    void stop();

    RenderBridge& bridge() { return bridge_; }
    core::ShutdownSignal& shutdownSignal() { return shutdown_; }
    const infra::net::ConnectionManager& connection() const { return connection_; }
    const ViewStateAggregator& aggregator() const { return aggregator_; }
    const config::Config& config() const { return config_; }

    static infra::net::ConnectionManager::Settings makeSettings(const config::Config& config);

private:
    const config::Config config_;
    core::ShutdownSignal shutdown_;
    core::EventChannel events_;
    core::CommandQueue commands_;
    core::SnapshotStore store_;
    core::EventBus bus_;
    infra::net::ConnectionManager connection_;
    ViewStateAggregator aggregator_;
    RenderBridge bridge_;

    std::mutex lifecycleMutex_;
    bool started_{false};
    bool stopped_{false};
};

}  // namespace app
