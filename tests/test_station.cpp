#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "FakeTransport.h"
#include "app/Station.h"
#include "app/StatusSummary.h"

using testing_support::FakeBackend;
using testing_support::makeFactory;
using testing_support::waitForCondition;
using namespace std::chrono_literals;

int main() {
    {
        config::Config cfg;
        cfg.backendUrl = "http://not-a-websocket/";
        bool threw = false;
        try {
            app::Station station(cfg, makeFactory(std::make_shared<FakeBackend>()));
        }
        catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Station must refuse a non-WebSocket backend URL\n";
            return 1;
        }
    }

    {
        auto backend = std::make_shared<FakeBackend>();
        backend->deliver(R"({"v":1,"type":"entity_update","id":"SOL","fields":{"px":140.25}})");

        config::Config cfg;
        cfg.backendUrl = "ws://backend.test:9000/stream";
        cfg.stationId = "desk-1";
        cfg.heartbeatIntervalMs = 0;
        cfg.readPollMs = 10;
        cfg.shutdownGraceMs = 10;

        app::Station station(cfg, makeFactory(backend));
        station.start();

        if (!waitForCondition(
                [&]() {
                    const auto snapshot = station.bridge().latestSnapshot();
                    return !snapshot->stale && snapshot->entities->count("SOL") == 1;
                },
                2000ms)) {
            std::cerr << "Station never published the live entity\n";
            return 1;
        }

        station.requestShutdown();
        if (!station.shutdownRequested() || !station.shutdownSignal().triggered()) {
            std::cerr << "Shutdown request was not recorded\n";
            return 1;
        }

        station.stop();
        station.stop();
        if (station.connection().isRunning() || station.aggregator().isRunning()) {
            std::cerr << "Threads must be joined after stop\n";
            return 1;
        }
        const auto last = station.bridge().latestSnapshot();
        if (last->connection != domain::ConnectionState::Disconnected || !last->stale
            || last->entities->count("SOL") != 1) {
            std::cerr << "Final snapshot must be disconnected, stale and keep the last entities\n";
            return 1;
        }
        if (last->sequence != station.aggregator().processedCount()) {
            std::cerr << "Final sequence must equal the processed event count\n";
            return 1;
        }
    }

    {
        // the window banner shows the reason code; the error text stays with the connection manager
        auto backend = std::make_shared<FakeBackend>();
        backend->failConnects = 1000;

        config::Config cfg;
        cfg.backendUrl = "ws://backend.test:9000/stream";
        cfg.heartbeatIntervalMs = 0;
        cfg.backoffBaseMs = 20;
        cfg.backoffCapMs = 40;
        cfg.backoffJitter = 0.0;
        cfg.readPollMs = 10;
        cfg.shutdownGraceMs = 10;

        app::Station station(cfg, makeFactory(backend));
        station.start();

        if (!waitForCondition(
                [&]() {
                    return station.bridge().latestSnapshot()->connection == domain::ConnectionState::Backoff;
                },
                2000ms)) {
            std::cerr << "Station never reported a reconnect backoff\n";
            return 1;
        }
        const auto snapshot = station.bridge().latestSnapshot();
        const auto banner = app::describeConnection(*snapshot, domain::nowMs());
        station.stop();

        if (banner.message.find("ConnectFailed") == std::string::npos
            || banner.message.find("refused") != std::string::npos) {
            std::cerr << "Unexpected reconnect banner '" << banner.message << "'\n";
            return 1;
        }
        if (station.connection().lastError().find("connection refused") == std::string::npos) {
            std::cerr << "Connection manager must keep the transport error text\n";
            return 1;
        }
    }

    return 0;
}
