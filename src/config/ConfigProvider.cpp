#include "config/ConfigProvider.h"

#include "logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace config {

namespace {
constexpr int kMinWindowSize = 320;
constexpr int kMinFrameRate = 1;
constexpr int kMaxFrameRate = 240;
constexpr int kMinPollMs = 5;

// file key, environment variable, long CLI flag, short CLI flag
struct SettingName {
    const char* key;
    const char* env;
    const char* flag;
    const char* shortFlag;
};

constexpr std::array<SettingName, 21> kSettings{{
    {"backendUrl", "VST_BACKEND_URL", "--backend-url", "-u"},
    {"stationId", "VST_STATION_ID", "--station-id", nullptr},
    {"subscriptions", "VST_SUBSCRIPTIONS", "--subscribe", "-s"},
    {"backoffBaseMs", "VST_BACKOFF_BASE_MS", "--backoff-base-ms", nullptr},
    {"backoffCapMs", "VST_BACKOFF_CAP_MS", "--backoff-cap-ms", nullptr},
    {"backoffJitter", "VST_BACKOFF_JITTER", "--backoff-jitter", nullptr},
    {"heartbeatIntervalMs", "VST_HEARTBEAT_MS", "--heartbeat-ms", nullptr},
    {"heartbeatMissLimit", "VST_HEARTBEAT_MISS", "--heartbeat-miss", nullptr},
    {"handshakeTimeoutMs", "VST_HANDSHAKE_TIMEOUT_MS", "--handshake-timeout-ms", nullptr},
    {"readPollMs", "VST_READ_POLL_MS", "--read-poll-ms", nullptr},
    {"shutdownGraceMs", "VST_SHUTDOWN_GRACE_MS", "--shutdown-grace-ms", nullptr},
    {"eventQueueCapacity", "VST_EVENT_QUEUE", "--event-queue", nullptr},
    {"commandQueueCapacity", "VST_COMMAND_QUEUE", "--command-queue", nullptr},
    {"windowWidth", "VST_WINDOW_W", "--window-width", "-w"},
    {"windowHeight", "VST_WINDOW_H", "--window-height", "-h"},
    {"fullscreen", "VST_FULLSCREEN", "--fullscreen", "-f"},
    {"frameRate", "VST_FRAME_RATE", "--frame-rate", nullptr},
    {"fontPath", "VST_FONT", "--font", nullptr},
    {"headless", "VST_HEADLESS", "--headless", nullptr},
    {"logLevel", "VST_LOG_LEVEL", "--log-level", "-l"},
    {"configFile", nullptr, nullptr, nullptr},
}};

bool isFlagOnly(const std::string& key) {
    return key == "fullscreen" || key == "headless";
}
}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string cliConfigPath;
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);
        if (arg == "--config") {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for --config\n");
            }
            else {
                cliConfigPath = argv[++i];
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            cliConfigPath = arg.substr(9);
        }
    }

    if (!cliConfigPath.empty()) {
        if (fileExists_(cliConfigPath)) {
            parseFile_(cliConfigPath);
            cfg_.configFile = cliConfigPath;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", cliConfigPath.c_str());
        }
    }
    else if (const char* envCfg = std::getenv("VST_CONFIG")) {
        std::string path(envCfg);
        if (fileExists_(path)) {
            parseFile_(path);
            cfg_.configFile = path;
        }
        else {
            std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        }
    }

    parseEnv_();
    parseCli_(argc, argv);
    normalize_();
}

LogLevel ConfigProvider::parseLogLevel(const std::string& value) {
    LogLevel level = LogLevel::Info;
    if (!logging::Log::try_parse_log_level(value, level)) {
        std::fprintf(stderr, "Invalid log level: %s (using info)\n", value.c_str());
    }
    return level;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    switch (l) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

std::vector<std::string> ConfigProvider::parseList(const std::string& value) {
    std::vector<std::string> items;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string item = trim_(value.substr(start, end - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

namespace {
const SettingName* findByKey(const std::string& key) {
    for (const auto& setting : kSettings) {
        if (key == setting.key) {
            return &setting;
        }
    }
    return nullptr;
}

const SettingName* findByFlag(const std::string& flag) {
    for (const auto& setting : kSettings) {
        if ((setting.flag && flag == setting.flag) || (setting.shortFlag && flag == setting.shortFlag)) {
            return &setting;
        }
    }
    return nullptr;
}
}  // namespace

// Invalid values are reported and the previous value kept.
void ConfigProvider::applySetting_(const std::string& key, const std::string& value) {
    Config& cfg = cfg_;
    auto setInt = [&](int& target, int minimum) {
        int parsed{};
        if (parseInt_(value, parsed)) {
            target = std::max(parsed, minimum);
        }
    };
    auto setSize = [&](std::size_t& target) {
        std::size_t parsed{};
        if (parseSize_(value, parsed) && parsed > 0) {
            target = parsed;
        }
        else {
            std::fprintf(stderr, "Invalid value for %s: %s\n", key.c_str(), value.c_str());
        }
    };
    auto setBool = [&](bool& target) {
        bool parsed{};
        if (parseBool_(value, parsed)) {
            target = parsed;
        }
        else {
            std::fprintf(stderr, "Invalid value for %s: %s\n", key.c_str(), value.c_str());
        }
    };

    if (key == "backendUrl") {
        cfg.backendUrl = value;
    }
    else if (key == "stationId") {
        cfg.stationId = value;
    }
    else if (key == "subscriptions") {
        cfg.subscriptions = ConfigProvider::parseList(value);
    }
    else if (key == "backoffBaseMs") {
        setInt(cfg.backoffBaseMs, 1);
    }
    else if (key == "backoffCapMs") {
        setInt(cfg.backoffCapMs, 1);
    }
    else if (key == "backoffJitter") {
        double parsed{};
        if (parseDouble_(value, parsed)) {
            cfg.backoffJitter = std::clamp(parsed, 0.0, 1.0);
        }
    }
    else if (key == "heartbeatIntervalMs") {
        setInt(cfg.heartbeatIntervalMs, 0);
    }
    else if (key == "heartbeatMissLimit") {
        setInt(cfg.heartbeatMissLimit, 1);
    }
    else if (key == "handshakeTimeoutMs") {
        setInt(cfg.handshakeTimeoutMs, 1);
    }
    else if (key == "readPollMs") {
        setInt(cfg.readPollMs, kMinPollMs);
    }
    else if (key == "shutdownGraceMs") {
        setInt(cfg.shutdownGraceMs, 0);
    }
    else if (key == "eventQueueCapacity") {
        setSize(cfg.eventQueueCapacity);
    }
    else if (key == "commandQueueCapacity") {
        setSize(cfg.commandQueueCapacity);
    }
    else if (key == "windowWidth") {
        setInt(cfg.windowWidth, kMinWindowSize);
    }
    else if (key == "windowHeight") {
        setInt(cfg.windowHeight, kMinWindowSize);
    }
    else if (key == "fullscreen") {
        setBool(cfg.windowFullscreen);
    }
    else if (key == "frameRate") {
        int parsed{};
        if (parseInt_(value, parsed)) {
            cfg.frameRate = std::clamp(parsed, kMinFrameRate, kMaxFrameRate);
        }
    }
    else if (key == "fontPath") {
        cfg.fontPath = value;
    }
    else if (key == "headless") {
        setBool(cfg.headless);
    }
    else if (key == "logLevel") {
        cfg.logLevel = ConfigProvider::parseLogLevel(value);
    }
}

void ConfigProvider::parseCli_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const char* raw = argv[i];
        if (!raw) {
            continue;
        }
        std::string arg(raw);

        auto takeNext = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc || !argv[i + 1]) {
                std::fprintf(stderr, "Missing value for %s\n", name);
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            cfg_.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg_.showVersion = true;
            continue;
        }
        if (arg == "--config") {
            // already consumed by the constructor
            ++i;
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }

        std::string flag = arg;
        std::optional<std::string> inlineValue;
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        const SettingName* setting = findByFlag(flag);
        if (!setting) {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            continue;
        }

        const std::string key(setting->key);
        if (isFlagOnly(key) && !inlineValue) {
            applySetting_(key, "true");
            continue;
        }

        std::optional<std::string> value = inlineValue ? inlineValue : takeNext(flag.c_str());
        if (value) {
            applySetting_(key, *value);
        }
    }
}

void ConfigProvider::parseEnv_() {
    for (const auto& setting : kSettings) {
        if (!setting.env) {
            continue;
        }
        if (const char* value = std::getenv(setting.env)) {
            applySetting_(setting.key, value);
        }
    }
}

void ConfigProvider::parseFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Unable to open config file: %s\n", path.c_str());
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        line = trim_(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = trim_(line.substr(0, pos));
        std::string value = trim_(line.substr(pos + 1));

        if (key == "configFile" || !findByKey(key)) {
            std::fprintf(stderr, "Ignoring unknown config key: %s\n", key.c_str());
            continue;
        }
        applySetting_(key, value);
    }
}

void ConfigProvider::normalize_() {
    if (cfg_.backoffCapMs < cfg_.backoffBaseMs) {
        std::fprintf(stderr,
                     "backoffCapMs (%d) below backoffBaseMs (%d); using base as cap\n",
                     cfg_.backoffCapMs,
                     cfg_.backoffBaseMs);
        cfg_.backoffCapMs = cfg_.backoffBaseMs;
    }
}

bool ConfigProvider::fileExists_(const std::string& path) {
    std::ifstream input(path);
    return input.good();
}

std::string ConfigProvider::trim_(const std::string& s) {
    std::string::size_type start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::string::size_type end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

bool ConfigProvider::parseBool_(const std::string& value, bool& out) {
    std::string lower = lowercase_(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigProvider::parseInt_(const std::string& value, int& out) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        std::fprintf(stderr, "Invalid integer value: %s\n", value.c_str());
        return false;
    }
}

bool ConfigProvider::parseSize_(const std::string& value, std::size_t& out) {
    if (value.empty() || value.front() == '-') {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed, 10);
        if (consumed != value.size()) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool ConfigProvider::parseDouble_(const std::string& value, double& out) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
            std::fprintf(stderr, "Invalid number value: %s\n", value.c_str());
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&) {
        std::fprintf(stderr, "Invalid number value: %s\n", value.c_str());
        return false;
    }
}

std::string ConfigProvider::lowercase_(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace config
