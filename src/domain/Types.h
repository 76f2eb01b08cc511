#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace domain {

using TimestampMs = long long;
using Sequence = std::uint64_t;

inline TimestampMs nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

enum class ConnectionState {
    Disconnected,
    Connecting,
    Backoff,
    Connected,
    Closing
};

enum class DisconnectReason {
    None,
    ConnectFailed,
    HandshakeTimeout,
    ReadError,
    WriteError,
    PeerClosed,
    HeartbeatTimeout,
    SchemaMismatch,
    // any failure that is not a transport or protocol error
    InternalError,
    Shutdown
};

inline const char* toString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Backoff:
        return "Backoff";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Closing:
        return "Closing";
    }
    return "Unknown";
}

inline const char* toString(DisconnectReason reason) {
    switch (reason) {
    case DisconnectReason::None:
        return "None";
    case DisconnectReason::ConnectFailed:
        return "ConnectFailed";
    case DisconnectReason::HandshakeTimeout:
        return "HandshakeTimeout";
    case DisconnectReason::ReadError:
        return "ReadError";
    case DisconnectReason::WriteError:
        return "WriteError";
    case DisconnectReason::PeerClosed:
        return "PeerClosed";
    case DisconnectReason::HeartbeatTimeout:
        return "HeartbeatTimeout";
    case DisconnectReason::SchemaMismatch:
        return "SchemaMismatch";
    case DisconnectReason::InternalError:
        return "InternalError";
    case DisconnectReason::Shutdown:
        return "Shutdown";
    }
    return "Unknown";
}

// Scalar carried by an entity field. Integers keep full int64 precision.
using FieldValue = std::variant<double, std::int64_t, bool, std::string>;
using FieldMap = std::map<std::string, FieldValue>;

std::string formatFieldValue(const FieldValue& value);

template <typename T>
struct Result {
    T value{};
    bool ok{true};
    std::string error{};

    bool failed() const { return !ok; }
};

}  // namespace domain
