#pragma once

#include "infra/net/Endpoint.h"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace infra::net {

class TransportError : public std::runtime_error {
public:
    enum class Kind { ConnectFailed, HandshakeTimeout, ReadFailed, WriteFailed };

    TransportError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

struct ReadResult {
    enum class Kind { Message, Timeout, Closed };

    Kind kind{Kind::Timeout};
    std::string payload{};
};

// Blocking message transport driven from a single thread.
// Every call returns within its timeout; failures throw TransportError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect(const Endpoint& endpoint, std::chrono::milliseconds handshakeTimeout) = 0;
    // Timeout leaves the connection usable; Closed means the peer finished the close handshake.
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;
    virtual void write(const std::string& text) = 0;
    // Never throws. The connection is unusable afterwards.
    virtual void close(std::chrono::milliseconds grace) noexcept = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

}  // namespace infra::net
