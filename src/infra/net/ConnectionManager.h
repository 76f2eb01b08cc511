#pragma once

#include "core/Backoff.h"
#include "core/CommandQueue.h"
#include "core/EventChannel.h"
#include "core/LogUtils.h"
#include "core/ShutdownSignal.h"
#include "domain/Types.h"
#include "infra/net/Endpoint.h"
#include "infra/net/Transport.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace infra::net {

// Owns the station's single backend connection. A dedicated thread connects,
// retries with capped exponential backoff, watches heartbeat liveness, pushes
// decoded events into the EventChannel and writes queued commands.
// Every state change is also pushed into the channel as a ConnectionStatus event.
class ConnectionManager {
public:
    struct Settings {
        Endpoint endpoint{};
        std::string stationId{};
        std::vector<std::string> subscriptions{};
        core::Backoff::Policy backoff{};
        std::chrono::milliseconds heartbeatInterval{1000};  // 0 disables liveness checks
        int heartbeatMissLimit{3};
        std::chrono::milliseconds handshakeTimeout{5000};
        std::chrono::milliseconds readPoll{100};
        std::chrono::milliseconds shutdownGrace{500};
    };

    using StateListener = std::function<void(domain::ConnectionState, domain::DisconnectReason)>;

    ConnectionManager(Settings settings,
                      TransportFactory transportFactory,
                      core::EventChannel& events,
                      core::CommandQueue& commands,
                      core::ShutdownSignal& shutdown);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void start();
    // Requests shutdown and joins the network thread. Idempotent.
    void stop();

    domain::ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    std::uint32_t retryCount() const { return retry_.load(std::memory_order_acquire); }
    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    domain::DisconnectReason lastReason() const { return lastReason_.load(std::memory_order_acquire); }
    std::string lastError() const;
    // Number of sessions that reached Connected.
    std::uint64_t sessionCount() const { return sessions_.load(std::memory_order_acquire); }

    // Called on the network thread after every transition.
    void setStateListener(StateListener listener);

    const Settings& settings() const { return settings_; }

private:
    struct SessionEnd {
        domain::DisconnectReason reason{domain::DisconnectReason::None};
        std::string detail{};
    };

    void run_();
    SessionEnd runSession_(Transport& transport);
    void writeCommand_(Transport& transport, const domain::OutboundCommand& command);
    bool handleFrame_(const std::string& payload, SessionEnd& end);
    void discardPendingCommands_();
    // Counts the attempt, announces Backoff and sleeps; false when shutdown interrupted the wait.
    bool waitBeforeRetry_(core::Backoff& backoff, domain::DisconnectReason reason, const std::string& detail);
    void transition_(domain::ConnectionState next,
                     domain::DisconnectReason reason,
                     const std::string& detail,
                     std::chrono::milliseconds retryIn = std::chrono::milliseconds{0});

    const Settings settings_;
    TransportFactory transportFactory_;
    core::EventChannel& events_;
    core::CommandQueue& commands_;
    core::ShutdownSignal& shutdown_;

    std::atomic<domain::ConnectionState> state_{domain::ConnectionState::Disconnected};
    std::atomic<domain::DisconnectReason> lastReason_{domain::DisconnectReason::None};
    std::atomic<std::uint32_t> retry_{0};
    std::atomic<std::uint64_t> sessions_{0};
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point lastHeartbeat_{};

    mutable std::mutex mutex_;
    std::string lastError_;
    StateListener stateListener_;

    core::RateLogger decodeLog_;
    std::mutex lifecycleMutex_;
    std::thread worker_;
};

}  // namespace infra::net
