#include "app/Station.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "infra/net/Endpoint.h"
#include "infra/net/WebSocketTransport.h"
#include "logging/Log.h"

namespace app {
namespace {

infra::net::TransportFactory orDefault(infra::net::TransportFactory factory) {
    if (factory) {
        return factory;
    }
    return []() -> std::unique_ptr<infra::net::Transport> {
        return std::make_unique<infra::net::WebSocketTransport>();
    };
}

}  // namespace

infra::net::ConnectionManager::Settings Station::makeSettings(const config::Config& config) {
    auto endpoint = infra::net::parseEndpoint(config.backendUrl);
    if (endpoint.failed()) {
        throw std::invalid_argument(endpoint.error);
    }

    infra::net::ConnectionManager::Settings settings;
    settings.endpoint = std::move(endpoint.value);
    settings.stationId = config.stationId;
    settings.subscriptions = config.subscriptions;
    settings.backoff.base = std::chrono::milliseconds(config.backoffBaseMs);
    settings.backoff.cap = std::chrono::milliseconds(config.backoffCapMs);
    settings.backoff.jitter = config.backoffJitter;
    settings.heartbeatInterval = std::chrono::milliseconds(config.heartbeatIntervalMs);
    settings.heartbeatMissLimit = config.heartbeatMissLimit;
    settings.handshakeTimeout = std::chrono::milliseconds(config.handshakeTimeoutMs);
    settings.readPoll = std::chrono::milliseconds(config.readPollMs);
    settings.shutdownGrace = std::chrono::milliseconds(config.shutdownGraceMs);
    return settings;
}

Station::Station(const config::Config& config, infra::net::TransportFactory transportFactory)
    : config_(config),
      events_(config.eventQueueCapacity),
      commands_(config.commandQueueCapacity),
      connection_(makeSettings(config), orDefault(std::move(transportFactory)), events_, commands_, shutdown_),
      aggregator_(events_, store_, bus_),
      bridge_(store_, bus_, commands_, connection_) {}

Station::~Station() {
    stop();
}

void Station::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_ || stopped_) {
        return;
    }
    started_ = true;
    aggregator_.start();
    connection_.start();
    LOG_INFO(logging::LogCategory::VIEW,
             "Station started backend=%s event_queue=%zu command_queue=%zu",
             config_.backendUrl.c_str(),
             events_.capacity(),
             commands_.capacity());
}

void Station::requestShutdown() {
    shutdown_.trigger();
    commands_.close();
}

void Station::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    requestShutdown();
    // the network thread's final status event must reach the channel before it closes
    connection_.stop();
    events_.close();
    aggregator_.stop();
    if (started_) {
        LOG_INFO(logging::LogCategory::VIEW,
                 "Station stopped sequence=%llu dropped_events=%llu",
                 static_cast<unsigned long long>(store_.sequence()),
                 static_cast<unsigned long long>(events_.droppedCount()));
    }
}

}  // namespace app
