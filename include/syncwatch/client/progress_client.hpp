/**
 * @file progress_client.hpp
 * @brief Per-job facade a UI panel instantiates to follow sync progress
 *
 * WHAT IT DOES:
 * - Owns a ReconnectionController for one source
 * - Decodes every frame, tracks the phase and keeps the latest snapshot
 * - Publishes snapshots, state changes, heartbeats and errors on its bus
 * - Sends a keepalive "ping" while connected over a duplex transport
 *
 * EXAMPLE:
 * ProgressClient client("src-1", make_websocket_factory(io, endpoint),
 *                       credentials, scheduler);
 * client.on_snapshot([](const ProgressSnapshot& s) { ... });
 * client.on_error([](const ClientError& e) { ... });
 * client.connect();
 *
 * THREADING:
 * Not thread-safe. Use from the thread that runs the transports and the
 * scheduler. Callbacks run synchronously on that thread, in arrival order.
 * A client must not be destroyed from inside one of its own callbacks.
 */

#pragma once

#include "syncwatch/client/connection_state.hpp"
#include "syncwatch/client/credentials.hpp"
#include "syncwatch/client/reconnect_policy.hpp"
#include "syncwatch/client/reconnection_controller.hpp"
#include "syncwatch/client/scheduler.hpp"
#include "syncwatch/core/error.hpp"
#include "syncwatch/events/event_bus.hpp"
#include "syncwatch/events/events.hpp"
#include "syncwatch/network/status_poller.hpp"
#include "syncwatch/network/transport.hpp"
#include "syncwatch/progress/phase.hpp"
#include "syncwatch/progress/snapshot.hpp"
#include "syncwatch/protocol/decoder.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace syncwatch::client {

struct ClientOptions {
    ReconnectPolicy reconnect;

    /// Interval between keepalive pings while connected; zero disables them
    std::chrono::milliseconds keepalive_interval{std::chrono::seconds(30)};

    /// Close intentionally right after delivering a completed/failed snapshot
    bool disconnect_on_terminal = false;
};

class ProgressClient {
public:
    using SnapshotCallback = std::function<void(const progress::ProgressSnapshot&)>;
    using StateCallback = std::function<void(ConnectionState previous, ConnectionState current)>;
    using ErrorCallback = std::function<void(const ClientError&)>;
    using HeartbeatCallback = std::function<void(const events::HeartbeatReceivedEvent&)>;

    static constexpr const char* kKeepaliveMessage = "ping";

    /// Does not connect; call connect() explicitly
    ProgressClient(std::string source_id,
                   network::TransportFactory factory,
                   std::shared_ptr<CredentialProvider> credentials,
                   Scheduler& scheduler,
                   ClientOptions options = {});

    ~ProgressClient();

    ProgressClient(const ProgressClient&) = delete;
    ProgressClient& operator=(const ProgressClient&) = delete;

    // Registration. No replay: a subscriber only sees what is published after it registers.
    events::SubscriptionId on_snapshot(SnapshotCallback callback);
    events::SubscriptionId on_connection_state_change(StateCallback callback);
    events::SubscriptionId on_error(ErrorCallback callback);
    events::SubscriptionId on_heartbeat(HeartbeatCallback callback);

    /**
     * @brief Start streaming; idempotent
     *
     * After a terminal error (no credential, retries exhausted) this starts
     * over with a fresh controller and zero reconnect attempts.
     */
    void connect();

    /**
     * @brief Intentional close
     *
     * Cancels any pending reconnect and keepalive, closes the transport with
     * code 1000 and clears latest_snapshot(). No frame or poll result is
     * delivered after this returns.
     */
    void disconnect();

    /// Manual retry: drops the current connection and starts a fresh controller
    void reconnect();

    /// Sends "ping" when connected over a transport that can send; otherwise does nothing
    bool send_keepalive();

    /// Poll fallback; the result is delivered through on_snapshot / on_error
    void set_status_poller(std::shared_ptr<network::StatusPoller> poller);
    void refresh();

    [[nodiscard]] ConnectionState connection_state() const;
    [[nodiscard]] std::uint32_t reconnect_attempts() const;
    [[nodiscard]] const std::optional<progress::ProgressSnapshot>& latest_snapshot() const { return latest_; }
    [[nodiscard]] std::optional<progress::Phase> phase() const { return phase_tracker_.current(); }
    [[nodiscard]] const progress::PhaseTracker& phase_tracker() const { return phase_tracker_; }
    [[nodiscard]] const std::string& source_id() const { return source_id_; }
    [[nodiscard]] const ClientOptions& options() const { return options_; }

    events::EventBus& bus() { return bus_; }

private:
    std::unique_ptr<ReconnectionController> make_controller();

    void handle_state_change(ConnectionState previous, ConnectionState current);
    void handle_frame(const network::RawFrame& frame);
    void handle_error(const ClientError& error);
    void handle_poll_result(network::StatusResult result);

    void deliver_snapshot(progress::ProgressSnapshot snapshot);
    void close_stream();

    void start_keepalive();
    void on_keepalive_tick();

    std::string source_id_;
    network::TransportFactory factory_;
    std::shared_ptr<CredentialProvider> credentials_;
    Scheduler& scheduler_;
    ClientOptions options_;

    events::EventBus bus_;
    protocol::MessageDecoder decoder_;
    progress::PhaseTracker phase_tracker_;
    std::optional<progress::ProgressSnapshot> latest_;

    std::unique_ptr<ReconnectionController> controller_;
    std::shared_ptr<network::StatusPoller> poller_;
    TimerHandle keepalive_timer_;

    // Bumped by disconnect(); poll results from an older epoch are dropped
    std::uint64_t epoch_ = 0;

    // Expires when the client is destroyed
    std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace syncwatch::client
