#pragma once

#include "domain/Messages.h"
#include "domain/Types.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace core {

struct EntityState {
    std::string id;
    domain::FieldMap fields;
    domain::TimestampMs updatedAtMs{0};
    // aggregator sequence of the last change
    domain::Sequence sequence{0};
};

using EntityMap = std::map<std::string, EntityState>;

// Immutable once published. Every entry reflects the events processed up to `sequence`.
struct ViewSnapshot {
    std::shared_ptr<const EntityMap> entities;
    domain::Sequence sequence{0};
    domain::TimestampMs generatedAtMs{0};
    bool stale{true};
    domain::ConnectionState connection{domain::ConnectionState::Disconnected};
    domain::DisconnectReason lastReason{domain::DisconnectReason::None};
    std::uint32_t retryCount{0};
    // wall-clock time of the next connection attempt, 0 when none is scheduled
    domain::TimestampMs retryAtMs{0};
    domain::TimestampMs lastHeartbeatMs{0};
    std::optional<domain::ErrorNotice> lastNotice;
    std::uint64_t droppedEvents{0};

    // Sequence 0, no entities, stale, Disconnected.
    static std::shared_ptr<const ViewSnapshot> bootstrap();
};

}  // namespace core
