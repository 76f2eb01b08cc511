#include "app/Station.h"
#include "app/StatusSummary.h"
#include "config/ConfigProvider.h"
#include "logging/Log.h"
#include "ui/StationWindow.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace bootstrap {
namespace {
constexpr std::chrono::seconds kHeadlessSummaryPeriod{1};

void printHelp(const config::Config& defaults) {
    std::cout << "Usage: vizstation [options]\n"
              << "  -u, --backend-url URL       (default: " << defaults.backendUrl << ")  ws:// or wss://\n"
              << "      --station-id ID         identifies this station to the backend\n"
              << "  -s, --subscribe T1,T2       topics subscribed on every connect\n"
              << "      --backoff-base-ms N     (default: " << defaults.backoffBaseMs << ")\n"
              << "      --backoff-cap-ms N      (default: " << defaults.backoffCapMs << ")\n"
              << "      --backoff-jitter F      0..1 (default: " << defaults.backoffJitter << ")\n"
              << "      --heartbeat-ms N        0 disables liveness (default: " << defaults.heartbeatIntervalMs << ")\n"
              << "      --heartbeat-miss N      (default: " << defaults.heartbeatMissLimit << ")\n"
              << "      --handshake-timeout-ms N (default: " << defaults.handshakeTimeoutMs << ")\n"
              << "      --read-poll-ms N        (default: " << defaults.readPollMs << ")\n"
              << "      --shutdown-grace-ms N   (default: " << defaults.shutdownGraceMs << ")\n"
              << "      --event-queue N         (default: " << defaults.eventQueueCapacity << ")\n"
              << "      --command-queue N       (default: " << defaults.commandQueueCapacity << ")\n"
              << "      --config FILE           key=value file (backendUrl=..., stationId=..., etc.)\n"
              << "  -w, --window-width N        (default: " << defaults.windowWidth << ")\n"
              << "  -h, --window-height N       (default: " << defaults.windowHeight << ")\n"
              << "  -f, --fullscreen            (default: " << (defaults.windowFullscreen ? "true" : "false") << ")\n"
              << "      --frame-rate N          (default: " << defaults.frameRate << ")\n"
              << "      --font PATH             font file for the window\n"
              << "      --headless              no window; log a status line every second\n"
              << "  -l, --log-level LEVEL       trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "      --help                  show this help\n"
              << "      --version               show the version\n"
              << "Environment: VST_BACKEND_URL, VST_STATION_ID, VST_SUBSCRIPTIONS, VST_BACKOFF_BASE_MS,\n"
              << "             VST_BACKOFF_CAP_MS, VST_BACKOFF_JITTER, VST_HEARTBEAT_MS, VST_HEARTBEAT_MISS,\n"
              << "             VST_HANDSHAKE_TIMEOUT_MS, VST_READ_POLL_MS, VST_SHUTDOWN_GRACE_MS,\n"
              << "             VST_EVENT_QUEUE, VST_COMMAND_QUEUE, VST_WINDOW_W, VST_WINDOW_H,\n"
              << "             VST_FULLSCREEN, VST_FRAME_RATE, VST_FONT, VST_HEADLESS, VST_LOG_LEVEL, VST_CONFIG\n"
              << "Precedence: CLI > ENV > file > defaults\n";
}

void printVersion() {
#ifdef PROJECT_NAME
    std::cout << PROJECT_NAME;
#else
    std::cout << "vizstation";
#endif
#ifdef PROJECT_VERSION
    std::cout << ' ' << PROJECT_VERSION;
#endif
    std::cout << '\n';
}

void runHeadless(app::Station& station) {
    LOG_INFO(logging::LogCategory::UI, "running headless");
    while (!station.shutdownSignal().waitFor(kHeadlessSummaryPeriod)) {
        const auto snapshot = station.bridge().latestSnapshot();
        LOG_INFO(logging::LogCategory::UI, "%s", app::summaryLine(*snapshot).c_str());
    }
}
}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        printHelp(config::Config{});
        return 0;
    }

    if (config.showVersion) {
        printVersion();
        return 0;
    }

    logging::Log::set_log_level(config.logLevel);
    LOG_INFO(logging::LogCategory::CONFIG,
             "Startup level=%s backend=%s config_file=%s headless=%d",
             logging::Log::level_to_string(config.logLevel),
             config.backendUrl.c_str(),
             config.configFile.empty() ? "-" : config.configFile.c_str(),
             config.headless ? 1 : 0);

    std::unique_ptr<app::Station> station;
    try {
        station = std::make_unique<app::Station>(config);
    }
    catch (const std::invalid_argument& ex) {
        LOG_ERROR(logging::LogCategory::CONFIG, "%s", ex.what());
        return 1;
    }

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
#if defined(SIGQUIT)
    signals.add(SIGQUIT);
#endif
    signals.async_wait([&station](const boost::system::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        LOG_INFO(logging::LogCategory::CONFIG, "received signal %d, shutting down", signalNumber);
        station->requestShutdown();
    });
    std::thread signalThread([&signalContext]() { signalContext.run(); });

    int exitCode = 0;
    try {
        station->start();
        if (config.headless) {
            runHeadless(*station);
        }
        else {
            ui::StationWindow window(*station, config);
            window.run();
        }
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::UI, "fatal: %s", ex.what());
        exitCode = 1;
    }

    station->stop();
    boost::system::error_code ignored;
    signals.cancel(ignored);
    signalContext.stop();
    signalThread.join();
    return exitCode;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    return bootstrap::run(argc, argv);
}
