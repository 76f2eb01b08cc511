#pragma once

#include "domain/Messages.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace infra::codec {

enum class DecodeError {
    None,
    // not JSON, not an object, or a required member missing or ill-typed
    Malformed,
    // "v" is an integer other than kSchemaVersion; the connection cannot continue
    SchemaMismatch,
    // well-formed frame of the right version with an unrecognised "type"/"op"
    UnknownShape
};

const char* toString(DecodeError error);

template <typename T>
struct Decoded {
    T value{};
    bool ok{true};
    DecodeError error{DecodeError::None};
    std::string detail{};

    bool failed() const { return !ok; }
};

using DecodeResult = Decoded<domain::InboundEvent>;
using CommandResult = Decoded<domain::OutboundCommand>;

class WireCodec {
public:
    static constexpr std::int64_t kSchemaVersion = 1;

    static DecodeResult decode(std::string_view raw);
    static std::string encode(const domain::OutboundCommand& command);

    // Loopback half: backend-side view of the protocol, used by replay harnesses and tests.
    static CommandResult decodeCommand(std::string_view raw);
    // Throws std::invalid_argument for ConnectionStatus, which never travels on the wire.
    static std::string encode(const domain::InboundEvent& event);
};

}  // namespace infra::codec
