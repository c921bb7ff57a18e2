#include "syncwatch/client/progress_client.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <variant>

namespace syncwatch::client {

ProgressClient::ProgressClient(std::string source_id,
                               network::TransportFactory factory,
                               std::shared_ptr<CredentialProvider> credentials,
                               Scheduler& scheduler,
                               ClientOptions options)
    : source_id_(std::move(source_id)),
      factory_(std::move(factory)),
      credentials_(std::move(credentials)),
      scheduler_(scheduler),
      options_(options),
      decoder_(source_id_) {}

ProgressClient::~ProgressClient() {
    disconnect();
}

events::SubscriptionId ProgressClient::on_snapshot(SnapshotCallback callback) {
    return bus_.subscribe<events::SnapshotReceivedEvent>(
        [callback = std::move(callback)](const events::SnapshotReceivedEvent& e) {
            callback(e.snapshot);
        });
}

events::SubscriptionId ProgressClient::on_connection_state_change(StateCallback callback) {
    return bus_.subscribe<events::ConnectionStateChangedEvent>(
        [callback = std::move(callback)](const events::ConnectionStateChangedEvent& e) {
            callback(e.previous, e.current);
        });
}

events::SubscriptionId ProgressClient::on_error(ErrorCallback callback) {
    return bus_.subscribe<events::ClientErrorEvent>(
        [callback = std::move(callback)](const events::ClientErrorEvent& e) {
            callback(e.error);
        });
}

events::SubscriptionId ProgressClient::on_heartbeat(HeartbeatCallback callback) {
    return bus_.subscribe<events::HeartbeatReceivedEvent>(std::move(callback));
}

std::unique_ptr<ReconnectionController> ProgressClient::make_controller() {
    ReconnectionController::Callbacks callbacks;
    callbacks.on_state_change = [this](ConnectionState previous, ConnectionState current) {
        handle_state_change(previous, current);
    };
    callbacks.on_frame = [this](const network::RawFrame& frame) { handle_frame(frame); };
    callbacks.on_error = [this](const ClientError& error) { handle_error(error); };

    return std::make_unique<ReconnectionController>(
        source_id_, factory_, credentials_, scheduler_, options_.reconnect, std::move(callbacks));
}

void ProgressClient::connect() {
    if (!controller_ || controller_->is_terminal()) {
        if (controller_) {
            spdlog::info("[Client] source={} starting over after terminal error", source_id_);
        }
        controller_ = make_controller();
    }
    controller_->connect();
}

void ProgressClient::disconnect() {
    close_stream();
    latest_.reset();
    phase_tracker_.reset();
}

void ProgressClient::close_stream() {
    keepalive_timer_.cancel();
    ++epoch_;
    if (controller_) {
        controller_->disconnect();
    }
}

void ProgressClient::reconnect() {
    spdlog::info("[Client] source={} manual reconnect", source_id_);
    disconnect();
    controller_ = make_controller();
    controller_->connect();
}

bool ProgressClient::send_keepalive() {
    if (!controller_ || !controller_->can_send()) {
        return false;
    }
    return controller_->send_text(kKeepaliveMessage);
}

void ProgressClient::set_status_poller(std::shared_ptr<network::StatusPoller> poller) {
    poller_ = std::move(poller);
}

void ProgressClient::refresh() {
    if (!poller_) {
        spdlog::warn("[Client] source={} refresh requested without a status poller", source_id_);
        return;
    }

    std::weak_ptr<char> guard = alive_;
    const auto epoch = epoch_;
    poller_->fetch(source_id_, [this, guard, epoch](network::StatusResult result) {
        if (guard.expired() || epoch != epoch_) {
            return;
        }
        handle_poll_result(std::move(result));
    });
}

ConnectionState ProgressClient::connection_state() const {
    return controller_ ? controller_->state() : ConnectionState::Disconnected;
}

std::uint32_t ProgressClient::reconnect_attempts() const {
    return controller_ ? controller_->reconnect_attempts() : 0;
}

void ProgressClient::handle_state_change(ConnectionState previous, ConnectionState current) {
    if (current == ConnectionState::Connected) {
        start_keepalive();
    } else {
        keepalive_timer_.cancel();
    }
    bus_.emit(events::ConnectionStateChangedEvent{source_id_, previous, current});
}

void ProgressClient::handle_frame(const network::RawFrame& frame) {
    auto decoded = decoder_.decode(frame);
    if (decoded.is_error()) {
        spdlog::warn("[Client] source={} {}", source_id_, decoded.error().message);
        handle_error(decoded.error());
        return;
    }

    auto& message = decoded.value();
    if (auto* progress = std::get_if<protocol::ProgressMessage>(&message)) {
        deliver_snapshot(std::move(progress->snapshot));
    } else if (auto* heartbeat = std::get_if<protocol::HeartbeatMessage>(&message)) {
        bus_.emit(events::HeartbeatReceivedEvent{heartbeat->source_id, heartbeat->is_active, heartbeat->timestamp});
    } else if (auto* connected = std::get_if<protocol::ConnectedMessage>(&message)) {
        spdlog::info("[Client] source={} subscription confirmed", connected->source_id);
    } else if (auto* server_error = std::get_if<protocol::ServerErrorMessage>(&message)) {
        std::string text = server_error->message;
        if (server_error->error_type) {
            text = *server_error->error_type + ": " + text;
        }
        handle_error(ClientError(ErrorKind::Server, std::move(text)));
    } else if (auto* closing = std::get_if<protocol::ClosingMessage>(&message)) {
        spdlog::info("[Client] source={} server closing stream: {}", closing->source_id, closing->message);
    }
}

void ProgressClient::handle_error(const ClientError& error) {
    bus_.emit(events::ClientErrorEvent{source_id_, error});
}

void ProgressClient::handle_poll_result(network::StatusResult result) {
    if (result.is_error()) {
        handle_error(result.error());
        return;
    }
    if (!result.value()) {
        spdlog::debug("[Client] source={} no active sync job", source_id_);
        return;
    }
    deliver_snapshot(std::move(*result.value()));
}

void ProgressClient::deliver_snapshot(progress::ProgressSnapshot snapshot) {
    phase_tracker_.observe(snapshot.phase);
    latest_ = snapshot;

    const bool terminal = snapshot.is_terminal();
    const auto epoch = epoch_;
    bus_.emit(events::SnapshotReceivedEvent{std::move(snapshot)});

    // A subscriber may already have disconnected
    if (terminal && options_.disconnect_on_terminal && epoch == epoch_) {
        spdlog::info("[Client] source={} job finished, closing stream", source_id_);
        close_stream();
    }
}

void ProgressClient::start_keepalive() {
    keepalive_timer_.cancel();
    if (options_.keepalive_interval.count() <= 0 || !controller_ || !controller_->can_send()) {
        return;
    }
    keepalive_timer_ = scheduler_.schedule(options_.keepalive_interval, [this]() { on_keepalive_tick(); });
}

void ProgressClient::on_keepalive_tick() {
    if (connection_state() != ConnectionState::Connected) {
        return;
    }
    send_keepalive();
    start_keepalive();
}

} // namespace syncwatch::client
