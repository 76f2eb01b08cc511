#include "infra/net/ConnectionManager.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include "common/Metrics.h"
#include "infra/codec/WireCodec.h"
#include "logging/Log.h"

namespace infra::net {
namespace {
constexpr std::chrono::milliseconds kDecodeLogInterval{1000};
constexpr std::chrono::milliseconds kMinPoll{1};

using vst::common::metrics::Registry;
namespace metric_names = vst::common::metrics::names;

domain::DisconnectReason reasonFor(const TransportError& error) {
    switch (error.kind()) {
    case TransportError::Kind::ConnectFailed:
        return domain::DisconnectReason::ConnectFailed;
    case TransportError::Kind::HandshakeTimeout:
        return domain::DisconnectReason::HandshakeTimeout;
    case TransportError::Kind::ReadFailed:
        return domain::DisconnectReason::ReadError;
    case TransportError::Kind::WriteFailed:
        return domain::DisconnectReason::WriteError;
    }
    return domain::DisconnectReason::ReadError;
}
}  // namespace

ConnectionManager::ConnectionManager(Settings settings,
                                     TransportFactory transportFactory,
                                     core::EventChannel& events,
                                     core::CommandQueue& commands,
                                     core::ShutdownSignal& shutdown)
    : settings_(std::move(settings)),
      transportFactory_(std::move(transportFactory)),
      events_(events),
      commands_(commands),
      shutdown_(shutdown) {}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (worker_.joinable() || shutdown_.triggered()) {
        return;
    }
    running_.store(true, std::memory_order_release);
    LOG_INFO(logging::LogCategory::NET,
             "ConnectionManager starting endpoint=%s station=%s topics=%zu",
             settings_.endpoint.url().c_str(),
             settings_.stationId.empty() ? "-" : settings_.stationId.c_str(),
             settings_.subscriptions.size());
    worker_ = std::thread(&ConnectionManager::run_, this);
}

void ConnectionManager::stop() {
    shutdown_.trigger();
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::string ConnectionManager::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void ConnectionManager::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateListener_ = std::move(listener);
}

void ConnectionManager::transition_(domain::ConnectionState next,
                                    domain::DisconnectReason reason,
                                    const std::string& detail,
                                    std::chrono::milliseconds retryIn) {
    state_.store(next, std::memory_order_release);
    if (reason != domain::DisconnectReason::None || next == domain::ConnectionState::Connected) {
        lastReason_.store(reason, std::memory_order_release);
    }

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!detail.empty() && reason != domain::DisconnectReason::None) {
            lastError_ = detail;
        }
        listener = stateListener_;
    }

    Registry::instance().setGauge(metric_names::kWsState, next == domain::ConnectionState::Connected ? 1.0 : 0.0);

    LOG_DEBUG(logging::LogCategory::NET,
              "ConnectionManager state=%s reason=%s retry=%u detail=%s",
              domain::toString(next),
              domain::toString(reason),
              retry_.load(std::memory_order_relaxed),
              detail.c_str());

    domain::ConnectionStatus status;
    status.state = next;
    status.reason = reason;
    status.retryCount = retry_.load(std::memory_order_relaxed);
    status.retryInMs = static_cast<std::int64_t>(retryIn.count());
    events_.push(std::move(status));

    if (listener) {
        try {
            listener(next, reason);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET, "ConnectionManager state listener failed: %s", ex.what());
        }
    }
}

void ConnectionManager::discardPendingCommands_() {
    const std::size_t dropped = commands_.clear();
    if (dropped > 0) {
        Registry::instance().incrementCounter(metric_names::kCommandsDropped, dropped);
        LOG_WARN(logging::LogCategory::NET, "ConnectionManager discarded %zu pending commands", dropped);
    }
}

bool ConnectionManager::waitBeforeRetry_(core::Backoff& backoff,
                                         domain::DisconnectReason reason,
                                         const std::string& detail) {
    const auto delay = backoff.nextDelay();
    retry_.store(backoff.retryCount(), std::memory_order_release);
    Registry::instance().incrementCounter(metric_names::kReconnectAttempts);
    LOG_WARN(logging::LogCategory::NET,
             "ConnectionManager connect failed attempt=%u wait_ms=%lld reason=%s: %s",
             backoff.retryCount(),
             static_cast<long long>(delay.count()),
             domain::toString(reason),
             detail.c_str());
    transition_(domain::ConnectionState::Backoff, reason, detail, delay);
    return !shutdown_.waitFor(delay);
}

void ConnectionManager::run_() {
    try {
        LOG_INFO(logging::LogCategory::NET, "ConnectionManager network thread starting");
        core::Backoff backoff(settings_.backoff);

        while (!shutdown_.triggered()) {
            transition_(domain::ConnectionState::Connecting, domain::DisconnectReason::None, settings_.endpoint.url());

            std::unique_ptr<Transport> transport;
            try {
                transport = transportFactory_ ? transportFactory_() : nullptr;
                if (!transport) {
                    throw std::runtime_error("transport factory produced no transport");
                }
                transport->connect(settings_.endpoint, settings_.handshakeTimeout);
            }
            catch (const TransportError& ex) {
                if (!waitBeforeRetry_(backoff, reasonFor(ex), ex.what())) {
                    break;
                }
                continue;
            }
            catch (const std::exception& ex) {
                LOG_ERROR(logging::LogCategory::NET, "ConnectionManager connection attempt failed: %s", ex.what());
                if (transport) {
                    transport->close(settings_.shutdownGrace);
                }
                if (!waitBeforeRetry_(backoff, domain::DisconnectReason::InternalError, ex.what())) {
                    break;
                }
                continue;
            }

            backoff.reset();
            retry_.store(0, std::memory_order_release);
            sessions_.fetch_add(1, std::memory_order_acq_rel);
            LOG_INFO(logging::LogCategory::NET, "ConnectionManager connected to %s", settings_.endpoint.url().c_str());
            transition_(domain::ConnectionState::Connected, domain::DisconnectReason::None, std::string());

            SessionEnd end;
            try {
                end = runSession_(*transport);
            }
            catch (const std::exception& ex) {
                LOG_ERROR(logging::LogCategory::NET, "ConnectionManager session failed: %s", ex.what());
                end.reason = domain::DisconnectReason::InternalError;
                end.detail = ex.what();
            }
            discardPendingCommands_();

            if (end.reason == domain::DisconnectReason::Shutdown) {
                transition_(domain::ConnectionState::Closing, domain::DisconnectReason::Shutdown, end.detail);
                transport->close(settings_.shutdownGrace);
                break;
            }

            transport->close(settings_.shutdownGrace);
            LOG_WARN(logging::LogCategory::NET,
                     "ConnectionManager disconnected reason=%s: %s",
                     domain::toString(end.reason),
                     end.detail.c_str());
            transition_(domain::ConnectionState::Disconnected, end.reason, end.detail, backoff.policy().base);

            // a peer that accepts and then drops must not be hammered
            Registry::instance().incrementCounter(metric_names::kReconnectAttempts);
            if (shutdown_.waitFor(backoff.policy().base)) {
                break;
            }
        }

        LOG_INFO(logging::LogCategory::NET, "ConnectionManager network thread stopping");
    }
    catch (const std::exception& ex) {
        LOG_ERROR(logging::LogCategory::NET, "ConnectionManager network thread failed: %s", ex.what());
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = ex.what();
    }

    discardPendingCommands_();
    transition_(domain::ConnectionState::Disconnected,
                shutdown_.triggered() ? domain::DisconnectReason::Shutdown : lastReason(),
                std::string());
    running_.store(false, std::memory_order_release);
}

ConnectionManager::SessionEnd ConnectionManager::runSession_(Transport& transport) {
    using Clock = std::chrono::steady_clock;
    SessionEnd end;
    lastHeartbeat_ = Clock::now();

    const bool liveness = settings_.heartbeatInterval.count() > 0;
    const auto livenessWindow = settings_.heartbeatInterval * std::max(settings_.heartbeatMissLimit, 1);

    try {
        if (!settings_.stationId.empty()) {
            writeCommand_(transport, domain::Hello{settings_.stationId});
        }
        if (!settings_.subscriptions.empty()) {
            writeCommand_(transport, domain::Subscribe{settings_.subscriptions});
        }

        while (true) {
            if (shutdown_.triggered()) {
                end.reason = domain::DisconnectReason::Shutdown;
                return end;
            }

            auto pending = commands_.drain();
            for (std::size_t i = 0; i < pending.size(); ++i) {
                try {
                    writeCommand_(transport, pending[i]);
                }
                catch (const TransportError&) {
                    const std::size_t lost = pending.size() - i;
                    Registry::instance().incrementCounter(metric_names::kCommandsDropped, lost);
                    LOG_WARN(logging::LogCategory::NET, "ConnectionManager lost %zu commands on write failure", lost);
                    throw;
                }
            }

            auto poll = settings_.readPoll;
            if (liveness) {
                const auto now = Clock::now();
                const auto deadline = lastHeartbeat_ + livenessWindow;
                if (now >= deadline) {
                    end.reason = domain::DisconnectReason::HeartbeatTimeout;
                    end.detail = "no heartbeat for "
                        + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now - lastHeartbeat_).count())
                        + " ms";
                    return end;
                }
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                poll = std::max(kMinPoll, std::min(poll, remaining));
            }

            ReadResult result = transport.read(poll);
            switch (result.kind) {
            case ReadResult::Kind::Timeout:
                break;
            case ReadResult::Kind::Closed:
                end.reason = domain::DisconnectReason::PeerClosed;
                end.detail = "peer closed the connection";
                return end;
            case ReadResult::Kind::Message:
                if (!handleFrame_(result.payload, end)) {
                    return end;
                }
                break;
            }
        }
    }
    catch (const TransportError& ex) {
        end.reason = reasonFor(ex);
        end.detail = ex.what();
    }
    return end;
}

void ConnectionManager::writeCommand_(Transport& transport, const domain::OutboundCommand& command) {
    const std::string frame = codec::WireCodec::encode(command);
    transport.write(frame);
    LOG_DEBUG(logging::LogCategory::NET,
              "ConnectionManager sent %s bytes=%zu",
              domain::commandName(command),
              frame.size());
}

bool ConnectionManager::handleFrame_(const std::string& payload, SessionEnd& end) {
    codec::DecodeResult decoded = codec::WireCodec::decode(payload);
    if (decoded.ok) {
        if (std::holds_alternative<domain::Heartbeat>(decoded.value)) {
            lastHeartbeat_ = std::chrono::steady_clock::now();
        }
        events_.push(std::move(decoded.value));
        return true;
    }

    switch (decoded.error) {
    case codec::DecodeError::SchemaMismatch:
        Registry::instance().incrementCounter(metric_names::kDecodeSchemaMismatch);
        LOG_ERROR(logging::LogCategory::CODEC, "schema mismatch, dropping connection: %s", decoded.detail.c_str());
        end.reason = domain::DisconnectReason::SchemaMismatch;
        end.detail = decoded.detail;
        return false;
    case codec::DecodeError::UnknownShape:
        Registry::instance().incrementCounter(metric_names::kDecodeUnknown);
        LOG_DEBUG(logging::LogCategory::CODEC, "ignoring frame: %s", decoded.detail.c_str());
        return true;
    case codec::DecodeError::Malformed:
    case codec::DecodeError::None:
        break;
    }

    Registry::instance().incrementCounter(metric_names::kDecodeMalformed);
    const auto decision = decodeLog_.allow("malformed", kDecodeLogInterval);
    if (decision.allowed) {
        LOG_WARN(logging::LogCategory::CODEC,
                 "dropping malformed frame bytes=%zu suppressed=%llu: %s",
                 payload.size(),
                 static_cast<unsigned long long>(decision.suppressed),
                 decoded.detail.c_str());
    }
    return true;
}

}  // namespace infra::net
