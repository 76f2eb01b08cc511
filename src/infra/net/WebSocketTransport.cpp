#include "infra/net/WebSocketTransport.h"

#include <type_traits>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Log.h"

namespace infra::net {
namespace {
constexpr std::chrono::milliseconds kDrainBudget{200};
constexpr const char* kUserAgent = "VizStation-WebSocketTransport";
}  // namespace

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;
using Clock = std::chrono::steady_clock;

WebSocketTransport::WebSocketTransport()
    : sslCtx_(ssl::context::tls_client) {
    sslCtx_.set_default_verify_paths();
    sslCtx_.set_verify_mode(ssl::verify_peer);
}

WebSocketTransport::~WebSocketTransport() {
    abort_();
}

bool WebSocketTransport::runUntil_(const PendingOp& op, Clock::time_point deadline) {
    while (!op.done) {
        if (Clock::now() >= deadline) {
            return false;
        }
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        if (ioc_.run_one_until(deadline) == 0 && ioc_.stopped() && !op.done) {
            // out of work: the operation can no longer complete
            return false;
        }
    }
    return true;
}

void WebSocketTransport::abort_() noexcept {
    beast::error_code ec;
    if (plain_) {
        beast::get_lowest_layer(*plain_).socket().close(ec);
    }
    if (tls_) {
        beast::get_lowest_layer(*tls_).socket().close(ec);
    }
    // let aborted handlers run before the streams they reference go away
    ioc_.restart();
    ioc_.run_for(kDrainBudget);
    ioc_.restart();

    plain_.reset();
    tls_.reset();
    pendingRead_.reset();
    buffer_.clear();
    open_ = false;
}

template <typename Fn>
void WebSocketTransport::withStream_(Fn&& fn) {
    if (tls_) {
        fn(*tls_);
    }
    else if (plain_) {
        fn(*plain_);
    }
    else {
        throw TransportError(TransportError::Kind::ReadFailed, "transport is not connected");
    }
}

template <typename Stream>
void WebSocketTransport::handshake_(Stream& ws,
                                    const Endpoint& endpoint,
                                    const tcp::resolver::results_type& results,
                                    Clock::time_point deadline) {
    auto connectOp = std::make_shared<PendingOp>();
    beast::get_lowest_layer(ws).async_connect(
        results, [connectOp](const beast::error_code& ec, const tcp::endpoint&) {
            connectOp->ec = ec;
            connectOp->done = true;
        });
    if (!runUntil_(*connectOp, deadline)) {
        throw TransportError(TransportError::Kind::HandshakeTimeout, "TCP connect timed out");
    }
    if (connectOp->ec) {
        throw TransportError(TransportError::Kind::ConnectFailed, "connect failed: " + connectOp->ec.message());
    }

    if constexpr (std::is_same_v<Stream, TlsStream>) {
        ws.next_layer().set_verify_callback(ssl::rfc2818_verification(endpoint.host));
        if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
            const unsigned long err = ::ERR_get_error();
            const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
            throw TransportError(TransportError::Kind::ConnectFailed,
                                 "failed to set SNI host name to '" + endpoint.host + "'"
                                     + (reason != nullptr ? std::string(": ") + reason : std::string()));
        }

        auto tlsOp = std::make_shared<PendingOp>();
        ws.next_layer().async_handshake(ssl::stream_base::client, [tlsOp](const beast::error_code& ec) {
            tlsOp->ec = ec;
            tlsOp->done = true;
        });
        if (!runUntil_(*tlsOp, deadline)) {
            throw TransportError(TransportError::Kind::HandshakeTimeout, "TLS handshake timed out");
        }
        if (tlsOp->ec) {
            throw TransportError(TransportError::Kind::ConnectFailed, "TLS handshake failed: " + tlsOp->ec.message());
        }
    }

    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, kUserAgent);
    }));

    auto upgradeOp = std::make_shared<PendingOp>();
    ws.async_handshake(endpoint.hostHeader(), endpoint.target, [upgradeOp](const beast::error_code& ec) {
        upgradeOp->ec = ec;
        upgradeOp->done = true;
    });
    if (!runUntil_(*upgradeOp, deadline)) {
        throw TransportError(TransportError::Kind::HandshakeTimeout, "WebSocket handshake timed out");
    }
    if (upgradeOp->ec) {
        throw TransportError(TransportError::Kind::ConnectFailed,
                             "WebSocket handshake failed: " + upgradeOp->ec.message());
    }
    ws.text(true);
}

void WebSocketTransport::connect(const Endpoint& endpoint, std::chrono::milliseconds handshakeTimeout) {
    abort_();
    writeTimeout_ = handshakeTimeout;
    const auto deadline = Clock::now() + handshakeTimeout;

    try {
        tcp::resolver resolver(ioc_);
        auto resolveOp = std::make_shared<PendingOp>();
        auto results = std::make_shared<tcp::resolver::results_type>();
        resolver.async_resolve(endpoint.host,
                               endpoint.port,
                               [resolveOp, results](const beast::error_code& ec, tcp::resolver::results_type found) {
                                   resolveOp->ec = ec;
                                   *results = std::move(found);
                                   resolveOp->done = true;
                               });
        if (!runUntil_(*resolveOp, deadline)) {
            resolver.cancel();
            throw TransportError(TransportError::Kind::HandshakeTimeout, "DNS resolve timed out");
        }
        if (resolveOp->ec) {
            throw TransportError(TransportError::Kind::ConnectFailed, "DNS resolve failed: " + resolveOp->ec.message());
        }

        LOG_DEBUG(logging::LogCategory::NET,
                  "WebSocketTransport resolved %s:%s endpoints=%zu",
                  endpoint.host.c_str(),
                  endpoint.port.c_str(),
                  static_cast<std::size_t>(results->size()));

        if (endpoint.tls) {
            tls_ = std::make_unique<TlsStream>(ioc_, sslCtx_);
            tls_->next_layer().set_verify_mode(ssl::verify_peer);
            handshake_(*tls_, endpoint, *results, deadline);
        }
        else {
            plain_ = std::make_unique<PlainStream>(ioc_);
            handshake_(*plain_, endpoint, *results, deadline);
        }
    }
    catch (const TransportError&) {
        abort_();
        throw;
    }
    open_ = true;
}

ReadResult WebSocketTransport::read(std::chrono::milliseconds timeout) {
    if (!open_) {
        throw TransportError(TransportError::Kind::ReadFailed, "read on a closed transport");
    }

    if (!pendingRead_) {
        buffer_.clear();
        auto op = std::make_shared<PendingOp>();
        pendingRead_ = op;
        withStream_([this, op](auto& ws) {
            ws.async_read(buffer_, [op](const beast::error_code& ec, std::size_t) {
                op->ec = ec;
                op->done = true;
            });
        });
    }

    if (!runUntil_(*pendingRead_, Clock::now() + timeout)) {
        return ReadResult{ReadResult::Kind::Timeout, {}};
    }

    const auto op = std::move(pendingRead_);
    pendingRead_.reset();
    if (op->ec == websocket::error::closed) {
        open_ = false;
        return ReadResult{ReadResult::Kind::Closed, {}};
    }
    if (op->ec) {
        open_ = false;
        throw TransportError(TransportError::Kind::ReadFailed, "read failed: " + op->ec.message());
    }

    ReadResult result{ReadResult::Kind::Message, beast::buffers_to_string(buffer_.cdata())};
    buffer_.clear();
    return result;
}

void WebSocketTransport::write(const std::string& text) {
    if (!open_) {
        throw TransportError(TransportError::Kind::WriteFailed, "write on a closed transport");
    }

    auto op = std::make_shared<PendingOp>();
    auto payload = std::make_shared<std::string>(text);
    withStream_([op, payload](auto& ws) {
        ws.async_write(asio::buffer(*payload), [op, payload](const beast::error_code& ec, std::size_t) {
            op->ec = ec;
            op->done = true;
        });
    });

    if (!runUntil_(*op, Clock::now() + writeTimeout_)) {
        open_ = false;
        throw TransportError(TransportError::Kind::WriteFailed, "write timed out");
    }
    if (op->ec) {
        open_ = false;
        throw TransportError(TransportError::Kind::WriteFailed, "write failed: " + op->ec.message());
    }
}

void WebSocketTransport::close(std::chrono::milliseconds grace) noexcept {
    if (open_ && (plain_ || tls_)) {
        auto op = std::make_shared<PendingOp>();
        const auto closeStream = [op](auto& ws) {
            ws.async_close(websocket::close_code::normal, [op](const beast::error_code& ec) {
                op->ec = ec;
                op->done = true;
            });
        };
        if (tls_) {
            closeStream(*tls_);
        }
        else {
            closeStream(*plain_);
        }
        if (!runUntil_(*op, Clock::now() + grace)) {
            LOG_DEBUG(logging::LogCategory::NET, "WebSocketTransport close handshake exceeded grace period");
        }
        else if (op->ec && op->ec != asio::error::operation_aborted) {
            LOG_DEBUG(logging::LogCategory::NET, "WebSocketTransport close failed: %s", op->ec.message().c_str());
        }
    }
    abort_();
}

}  // namespace infra::net
