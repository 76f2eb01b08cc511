#include <iostream>
#include <memory>
#include <string>

#include "app/StatusSummary.h"

using app::BannerTone;

namespace {

bool expectBanner(const app::Banner& banner, BannerTone tone, const std::string& message) {
    if (banner.tone != tone || banner.message != message) {
        std::cerr << "Unexpected banner '" << banner.message << "', expected '" << message << "'\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    const domain::TimestampMs now = 1'000'000;

    core::ViewSnapshot snapshot = *core::ViewSnapshot::bootstrap();
    if (!expectBanner(app::describeConnection(snapshot, now), BannerTone::Disconnected, "Disconnected: None")) {
        return 1;
    }

    snapshot.connection = domain::ConnectionState::Connected;
    snapshot.stale = false;
    if (!expectBanner(app::describeConnection(snapshot, now), BannerTone::Live, "Live")) {
        return 1;
    }

    snapshot.connection = domain::ConnectionState::Connecting;
    snapshot.retryCount = 2;
    if (!expectBanner(app::describeConnection(snapshot, now), BannerTone::Connecting, "Connecting... (attempt 3)")) {
        return 1;
    }

    snapshot.connection = domain::ConnectionState::Backoff;
    snapshot.lastReason = domain::DisconnectReason::ConnectFailed;
    snapshot.retryAtMs = now + 1500;
    if (!expectBanner(app::describeConnection(snapshot, now),
                      BannerTone::Reconnecting,
                      "Reconnecting in 1.5s (attempt 2): ConnectFailed")) {
        return 1;
    }

    {
        auto entities = std::make_shared<core::EntityMap>();
        core::EntityState entity;
        entity.id = "BTC";
        entity.fields["bid"] = 64000.5;
        entity.fields["halted"] = false;
        entity.fields["qty"] = std::int64_t{12};
        entity.fields["venue"] = std::string("X");
        entities->emplace("BTC", entity);

        snapshot.entities = entities;
        snapshot.stale = true;
        snapshot.connection = domain::ConnectionState::Disconnected;
        snapshot.lastReason = domain::DisconnectReason::HeartbeatTimeout;
        snapshot.retryAtMs = 0;
        if (!expectBanner(app::describeConnection(snapshot, now),
                          BannerTone::Disconnected,
                          "Disconnected: HeartbeatTimeout  [stale]")) {
            return 1;
        }

        const std::string row = app::formatEntityRow(entity);
        if (row != "BTC  bid=64000.5  halted=false  qty=12  venue=X") {
            std::cerr << "Unexpected entity row '" << row << "'\n";
            return 1;
        }
    }

    snapshot.sequence = 17;
    snapshot.droppedEvents = 4;
    snapshot.lastNotice = domain::ErrorNotice{429, "slow down"};
    const std::string footer = app::footerText(snapshot);
    if (footer != "seq 17 | entities 1 | dropped 4 | notice [429] slow down") {
        std::cerr << "Unexpected footer '" << footer << "'\n";
        return 1;
    }

    const std::string summary = app::summaryLine(snapshot);
    if (summary.find("state=Disconnected") == std::string::npos || summary.find("seq=17") == std::string::npos
        || summary.find("entities=1") == std::string::npos) {
        std::cerr << "Unexpected summary '" << summary << "'\n";
        return 1;
    }

    return 0;
}
