#pragma once

#include <string>

#include "core/ViewSnapshot.h"
#include "domain/Types.h"

namespace app {

enum class BannerTone { Live, Connecting, Reconnecting, Disconnected, Closing };

struct Banner {
    BannerTone tone{BannerTone::Disconnected};
    std::string message;
};

// Text shown by the station window and the headless logger. No rendering here.
Banner describeConnection(const core::ViewSnapshot& snapshot, domain::TimestampMs nowMs);
std::string formatEntityRow(const core::EntityState& entity);
std::string footerText(const core::ViewSnapshot& snapshot);
std::string summaryLine(const core::ViewSnapshot& snapshot);

}  // namespace app
