/**
 * @file event_stream_transport.hpp
 * @brief Push-stream transport over text/event-stream (Boost.Beast HTTP)
 *
 * Issues GET /api/sources/{id}/sync/progress and keeps reading the body.
 * Each dispatched event becomes one RawFrame whose event_name is the
 * "event:" field. The channel is receive-only.
 *
 * CLOSE MAPPING:
 * - Non-200 answer -> on_error, then 1006
 * - Server ends the body or drops the connection -> 1006
 */

#pragma once

#include "syncwatch/network/endpoint.hpp"
#include "syncwatch/network/transport.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>

namespace syncwatch::network {

class EventStreamTransport : public Transport {
public:
    EventStreamTransport(boost::asio::io_context& io,
                         const ServerEndpoint& endpoint,
                         const TransportRequest& request);

    ~EventStreamTransport() override;

    EventStreamTransport(const EventStreamTransport&) = delete;
    EventStreamTransport& operator=(const EventStreamTransport&) = delete;

    TransportKind kind() const noexcept override { return TransportKind::EventStream; }

    void open(TransportHandlers handlers) override;
    void close(std::uint16_t code, const std::string& reason) override;

    bool supports_send() const noexcept override { return false; }
    Result<void> send_text(const std::string& payload) override;

private:
    class Session;
    std::shared_ptr<Session> session_;
};

TransportFactory make_event_stream_factory(boost::asio::io_context& io, ServerEndpoint endpoint);

} // namespace syncwatch::network
