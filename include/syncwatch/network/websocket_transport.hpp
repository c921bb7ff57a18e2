/**
 * @file websocket_transport.hpp
 * @brief Duplex transport over WebSocket (Boost.Beast)
 *
 * Connects to ws://host:port/api/sources/{id}/sync/progress/ws?token=...
 * The credential travels in the query string because the browser-style
 * handshake leaves no room for custom headers on the server side.
 *
 * CLOSE MAPPING:
 * - Server close frame -> its code and reason
 * - Anything else (resolve, connect, handshake, read, write) -> on_error, then 1006
 */

#pragma once

#include "syncwatch/network/endpoint.hpp"
#include "syncwatch/network/transport.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>

namespace syncwatch::network {

class WebSocketTransport : public Transport {
public:
    WebSocketTransport(boost::asio::io_context& io,
                       const ServerEndpoint& endpoint,
                       const TransportRequest& request);

    /// Closes with 1000 if still open; no callbacks fire
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    TransportKind kind() const noexcept override { return TransportKind::WebSocket; }

    void open(TransportHandlers handlers) override;
    void close(std::uint16_t code, const std::string& reason) override;

    bool supports_send() const noexcept override { return true; }
    Result<void> send_text(const std::string& payload) override;

private:
    class Session;
    std::shared_ptr<Session> session_;
};

TransportFactory make_websocket_factory(boost::asio::io_context& io, ServerEndpoint endpoint);

} // namespace syncwatch::network
