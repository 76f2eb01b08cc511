#pragma once

#include "domain/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace domain {

// Inbound events, decoded from the wire or produced locally.

struct EntityUpdate {
    std::string id;
    FieldMap fields;
    std::optional<std::uint64_t> wireSeq{};
    TimestampMs timestampMs{0};
    bool replace{false};
};

struct EntityRemoval {
    std::string id;
    std::optional<std::uint64_t> wireSeq{};
};

struct Heartbeat {
    TimestampMs timestampMs{0};
};

struct ErrorNotice {
    std::int64_t code{0};
    std::string message;
};

// Reason code only. Error text stays in the connection manager's log and lastError().
struct ConnectionStatus {
    ConnectionState state{ConnectionState::Disconnected};
    DisconnectReason reason{DisconnectReason::None};
    std::uint32_t retryCount{0};
    // Backoff only: delay before the next connection attempt.
    std::int64_t retryInMs{0};
};

using InboundEvent = std::variant<EntityUpdate, EntityRemoval, Heartbeat, ErrorNotice, ConnectionStatus>;

// Outbound commands, GUI to backend.

struct Subscribe {
    std::vector<std::string> topics;
};

struct Unsubscribe {
    std::vector<std::string> topics;
};

struct Ping {
    std::uint64_t nonce{0};
};

struct Hello {
    std::string stationId;
};

using OutboundCommand = std::variant<Subscribe, Unsubscribe, Ping, Hello>;

bool operator==(const EntityUpdate& lhs, const EntityUpdate& rhs);
bool operator==(const EntityRemoval& lhs, const EntityRemoval& rhs);
bool operator==(const Heartbeat& lhs, const Heartbeat& rhs);
bool operator==(const ErrorNotice& lhs, const ErrorNotice& rhs);
bool operator==(const ConnectionStatus& lhs, const ConnectionStatus& rhs);
bool operator==(const Subscribe& lhs, const Subscribe& rhs);
bool operator==(const Unsubscribe& lhs, const Unsubscribe& rhs);
bool operator==(const Ping& lhs, const Ping& rhs);
bool operator==(const Hello& lhs, const Hello& rhs);

const char* eventName(const InboundEvent& event);
const char* commandName(const OutboundCommand& command);

}  // namespace domain
