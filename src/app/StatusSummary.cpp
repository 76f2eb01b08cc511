#include "app/StatusSummary.h"

#include <cstdio>

namespace app {
namespace {

std::string secondsText(domain::TimestampMs ms) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1fs", static_cast<double>(ms < 0 ? 0 : ms) / 1000.0);
    return buffer;
}

}  // namespace

Banner describeConnection(const core::ViewSnapshot& snapshot, domain::TimestampMs nowMs) {
    Banner banner;
    const domain::TimestampMs untilRetry = snapshot.retryAtMs > 0 ? snapshot.retryAtMs - nowMs : 0;

    switch (snapshot.connection) {
    case domain::ConnectionState::Connected:
        banner.tone = BannerTone::Live;
        banner.message = "Live";
        break;
    case domain::ConnectionState::Connecting:
        banner.tone = BannerTone::Connecting;
        banner.message = snapshot.retryCount > 0
            ? "Connecting... (attempt " + std::to_string(snapshot.retryCount + 1) + ")"
            : std::string("Connecting...");
        break;
    case domain::ConnectionState::Backoff:
        banner.tone = BannerTone::Reconnecting;
        banner.message = "Reconnecting in " + secondsText(untilRetry) + " (attempt "
            + std::to_string(snapshot.retryCount) + "): " + domain::toString(snapshot.lastReason);
        break;
    case domain::ConnectionState::Disconnected:
        banner.tone = BannerTone::Disconnected;
        banner.message = std::string("Disconnected: ") + domain::toString(snapshot.lastReason);
        if (untilRetry > 0) {
            banner.message += ", retrying in " + secondsText(untilRetry);
        }
        break;
    case domain::ConnectionState::Closing:
        banner.tone = BannerTone::Closing;
        banner.message = "Closing...";
        break;
    }

    if (snapshot.stale && snapshot.entities && !snapshot.entities->empty()) {
        banner.message += "  [stale]";
    }
    return banner;
}

std::string formatEntityRow(const core::EntityState& entity) {
    std::string row = entity.id;
    for (const auto& [name, value] : entity.fields) {
        row += "  " + name + "=" + domain::formatFieldValue(value);
    }
    return row;
}

std::string footerText(const core::ViewSnapshot& snapshot) {
    std::string text = "seq " + std::to_string(snapshot.sequence)
        + " | entities " + std::to_string(snapshot.entities ? snapshot.entities->size() : 0)
        + " | dropped " + std::to_string(snapshot.droppedEvents);
    if (snapshot.lastNotice) {
        text += " | notice [" + std::to_string(snapshot.lastNotice->code) + "] " + snapshot.lastNotice->message;
    }
    return text;
}

std::string summaryLine(const core::ViewSnapshot& snapshot) {
    char buffer[256];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "state=%s reason=%s seq=%llu entities=%zu stale=%d dropped=%llu retry=%u last_heartbeat_ms=%lld",
                  domain::toString(snapshot.connection),
                  domain::toString(snapshot.lastReason),
                  static_cast<unsigned long long>(snapshot.sequence),
                  snapshot.entities ? snapshot.entities->size() : static_cast<std::size_t>(0),
                  snapshot.stale ? 1 : 0,
                  static_cast<unsigned long long>(snapshot.droppedEvents),
                  snapshot.retryCount,
                  static_cast<long long>(snapshot.lastHeartbeatMs));
    return buffer;
}

}  // namespace app
