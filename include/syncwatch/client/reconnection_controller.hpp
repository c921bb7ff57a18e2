/**
 * @file reconnection_controller.hpp
 * @brief Owns one transport at a time and decides when to reopen it
 *
 * STATE:
 *   connecting -> connected -> disconnected
 *
 * On an abnormal close (any code but 1000) the controller reopens after
 * base_delay * 2^attempts, up to max_attempts times without an
 * intervening successful open. Each such close is reported as a Transport
 * error unless the transport already sent on_error for that connection;
 * the close that exhausts the bound is reported as ReconnectExhausted
 * instead. After that, or after a connect() with no
 * credential, the controller is terminal: connect() does nothing and the
 * owner must build a fresh one.
 *
 * Callbacks run on the thread that delivered the transport event or
 * timer. Any of them may call back into the controller, or destroy it.
 */

#pragma once

#include "syncwatch/client/connection_state.hpp"
#include "syncwatch/client/credentials.hpp"
#include "syncwatch/client/reconnect_policy.hpp"
#include "syncwatch/client/scheduler.hpp"
#include "syncwatch/core/error.hpp"
#include "syncwatch/network/transport.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace syncwatch::client {

class ReconnectionController {
public:
    struct Callbacks {
        std::function<void(ConnectionState previous, ConnectionState current)> on_state_change;
        std::function<void(const network::RawFrame&)> on_frame;
        std::function<void(const ClientError&)> on_error;
    };

    ReconnectionController(std::string source_id,
                           network::TransportFactory factory,
                           std::shared_ptr<CredentialProvider> credentials,
                           Scheduler& scheduler,
                           ReconnectPolicy policy,
                           Callbacks callbacks);

    /// Closes any open transport with 1000 and cancels a pending reopen; no callbacks fire
    ~ReconnectionController();

    ReconnectionController(const ReconnectionController&) = delete;
    ReconnectionController& operator=(const ReconnectionController&) = delete;

    /**
     * @brief Open a transport unless one is already open or opening
     *
     * Reads the credential once. With no credential, reports a single
     * Authentication error, returns to disconnected and becomes terminal
     * without constructing a transport.
     */
    void connect();

    /// Intentional close: cancels any pending reopen, never reconnects, and resets the attempt count
    void disconnect();

    /// Sends over the open transport; false when not connected or unsupported
    bool send_text(const std::string& payload);

    [[nodiscard]] bool can_send() const;

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] std::uint32_t reconnect_attempts() const { return attempts_; }
    [[nodiscard]] bool is_terminal() const { return terminal_; }
    [[nodiscard]] bool reconnect_pending() const { return reconnect_timer_.pending(); }
    [[nodiscard]] const ReconnectPolicy& policy() const { return policy_; }
    [[nodiscard]] const std::string& source_id() const { return source_id_; }

private:
    network::TransportHandlers make_handlers(std::uint64_t generation);

    void handle_open(std::uint64_t generation);
    void handle_frame(std::uint64_t generation, const network::RawFrame& frame);
    void handle_error(std::uint64_t generation, const std::string& message);
    void handle_close(std::uint64_t generation, const network::CloseInfo& info);

    /// Each returns false when the controller was destroyed by the callback
    bool set_state(ConnectionState next);
    bool report(const ClientError& error);

    std::string source_id_;
    network::TransportFactory factory_;
    std::shared_ptr<CredentialProvider> credentials_;
    Scheduler& scheduler_;
    ReconnectPolicy policy_;
    Callbacks callbacks_;

    ConnectionState state_ = ConnectionState::Disconnected;
    std::uint32_t attempts_ = 0;
    bool terminal_ = false;
    bool intentional_close_ = false;
    bool error_reported_ = false;  // Current transport already reported through on_error

    std::unique_ptr<network::Transport> transport_;
    TimerHandle reconnect_timer_;

    // Bumped whenever the current transport is abandoned; stale callbacks compare unequal
    std::uint64_t generation_ = 0;

    // Expires when the controller is destroyed
    std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace syncwatch::client
