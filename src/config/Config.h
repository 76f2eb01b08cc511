#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

inline bool logLevelAtLeast(LogLevel level, LogLevel threshold) {
    return logLevelSeverity(level) <= logLevelSeverity(threshold);
}

struct Config {
    // backend
    std::string backendUrl           = "ws://127.0.0.1:9000/stream";
    std::string stationId            = "";
    std::vector<std::string> subscriptions{};

    // reconnect / liveness
    int backoffBaseMs                = 500;
    int backoffCapMs                 = 30000;
    double backoffJitter             = 0.5;
    int heartbeatIntervalMs          = 1000;
    int heartbeatMissLimit           = 3;
    int handshakeTimeoutMs           = 5000;
    int readPollMs                   = 100;
    int shutdownGraceMs              = 500;

    // channels
    std::size_t eventQueueCapacity   = 4096;
    std::size_t commandQueueCapacity = 256;

    // UI
    int windowWidth                  = 1280;
    int windowHeight                 = 720;
    bool windowFullscreen            = false;
    int frameRate                    = 60;
    std::string fontPath             = "";
    bool headless                    = false;

    // IO
    std::string configFile           = "";

    // logs
    LogLevel logLevel                = LogLevel::Info;

    // util
    bool showHelp                    = false;
    bool showVersion                 = false;
};

}  // namespace config
