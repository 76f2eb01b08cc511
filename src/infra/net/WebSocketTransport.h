#pragma once

#include "infra/net/Transport.h"

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

namespace infra::net {

// Beast WebSocket client (plain TCP or TLS) behind the blocking Transport port.
// Operations are started asynchronously and the private io_context is run until
// they finish or their deadline passes, so a read can time out without
// tearing down the stream; the pending read carries over to the next call.
class WebSocketTransport final : public Transport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void connect(const Endpoint& endpoint, std::chrono::milliseconds handshakeTimeout) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    void write(const std::string& text) override;
    void close(std::chrono::milliseconds grace) noexcept override;

private:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using TlsStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    struct PendingOp {
        bool done{false};
        boost::beast::error_code ec{};
    };

    template <typename Stream>
    void handshake_(Stream& ws,
                    const Endpoint& endpoint,
                    const boost::asio::ip::tcp::resolver::results_type& results,
                    std::chrono::steady_clock::time_point deadline);

    template <typename Fn>
    void withStream_(Fn&& fn);

    bool runUntil_(const PendingOp& op, std::chrono::steady_clock::time_point deadline);
    void abort_() noexcept;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslCtx_;
    std::unique_ptr<PlainStream> plain_;
    std::unique_ptr<TlsStream> tls_;
    boost::beast::flat_buffer buffer_;
    std::shared_ptr<PendingOp> pendingRead_;
    std::chrono::milliseconds writeTimeout_{5000};
    bool open_{false};
};

}  // namespace infra::net
