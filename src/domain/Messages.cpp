#include "domain/Messages.h"

namespace domain {

bool operator==(const EntityUpdate& lhs, const EntityUpdate& rhs) {
    return lhs.id == rhs.id && lhs.fields == rhs.fields && lhs.wireSeq == rhs.wireSeq
        && lhs.timestampMs == rhs.timestampMs && lhs.replace == rhs.replace;
}

bool operator==(const EntityRemoval& lhs, const EntityRemoval& rhs) {
    return lhs.id == rhs.id && lhs.wireSeq == rhs.wireSeq;
}

bool operator==(const Heartbeat& lhs, const Heartbeat& rhs) {
    return lhs.timestampMs == rhs.timestampMs;
}

bool operator==(const ErrorNotice& lhs, const ErrorNotice& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message;
}

bool operator==(const ConnectionStatus& lhs, const ConnectionStatus& rhs) {
    return lhs.state == rhs.state && lhs.reason == rhs.reason && lhs.retryCount == rhs.retryCount
        && lhs.retryInMs == rhs.retryInMs;
}

bool operator==(const Subscribe& lhs, const Subscribe& rhs) {
    return lhs.topics == rhs.topics;
}

bool operator==(const Unsubscribe& lhs, const Unsubscribe& rhs) {
    return lhs.topics == rhs.topics;
}

bool operator==(const Ping& lhs, const Ping& rhs) {
    return lhs.nonce == rhs.nonce;
}

bool operator==(const Hello& lhs, const Hello& rhs) {
    return lhs.stationId == rhs.stationId;
}

const char* eventName(const InboundEvent& event) {
    switch (event.index()) {
    case 0:
        return "entity_update";
    case 1:
        return "entity_remove";
    case 2:
        return "heartbeat";
    case 3:
        return "error";
    case 4:
        return "connection_status";
    default:
        return "unknown";
    }
}

const char* commandName(const OutboundCommand& command) {
    switch (command.index()) {
    case 0:
        return "subscribe";
    case 1:
        return "unsubscribe";
    case 2:
        return "ping";
    case 3:
        return "hello";
    default:
        return "unknown";
    }
}

}  // namespace domain
