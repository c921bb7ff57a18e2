#include "syncwatch/client/reconnection_controller.hpp"

#include <spdlog/spdlog.h>

namespace syncwatch::client {

namespace {
constexpr const char* kClientDisconnectReason = "Client disconnect";
}

ReconnectionController::ReconnectionController(std::string source_id,
                                               network::TransportFactory factory,
                                               std::shared_ptr<CredentialProvider> credentials,
                                               Scheduler& scheduler,
                                               ReconnectPolicy policy,
                                               Callbacks callbacks)
    : source_id_(std::move(source_id)),
      factory_(std::move(factory)),
      credentials_(std::move(credentials)),
      scheduler_(scheduler),
      policy_(policy),
      callbacks_(std::move(callbacks)) {}

ReconnectionController::~ReconnectionController() {
    reconnect_timer_.cancel();
    ++generation_;
    if (auto transport = std::move(transport_)) {
        transport->close(network::kNormalClosure, kClientDisconnectReason);
    }
}

void ReconnectionController::connect() {
    if (terminal_) {
        spdlog::debug("[Connection] source={} connect ignored, controller is terminal", source_id_);
        return;
    }
    if (state_ == ConnectionState::Connected) {
        return;
    }
    if (state_ == ConnectionState::Connecting && transport_) {
        return;
    }

    reconnect_timer_.cancel();
    intentional_close_ = false;
    error_reported_ = false;
    const auto generation = ++generation_;

    if (!set_state(ConnectionState::Connecting) || generation != generation_) {
        return;
    }

    auto token = credentials_ ? credentials_->bearer_token() : std::nullopt;
    if (!token) {
        terminal_ = true;
        spdlog::error("[Connection] source={} no credential available, not connecting", source_id_);
        if (!set_state(ConnectionState::Disconnected)) {
            return;
        }
        report(ClientError(ErrorKind::Authentication, "No authentication credential available"));
        return;
    }

    network::TransportRequest request{source_id_, std::move(*token)};
    transport_ = factory_ ? factory_(request) : nullptr;
    if (!transport_) {
        spdlog::warn("[Connection] source={} transport factory produced no transport", source_id_);
        error_reported_ = true;
        if (!report(ClientError(ErrorKind::Transport, "Transport could not be created")) ||
            generation != generation_) {
            return;
        }
        handle_close(generation, network::CloseInfo{network::kAbnormalClosure, "transport unavailable"});
        return;
    }

    spdlog::info("[Connection] source={} opening {} (attempt {})",
                 source_id_, network::to_string(transport_->kind()), attempts_);
    transport_->open(make_handlers(generation));
}

void ReconnectionController::disconnect() {
    reconnect_timer_.cancel();
    intentional_close_ = true;
    attempts_ = 0;
    ++generation_;

    if (auto transport = std::move(transport_)) {
        spdlog::info("[Connection] source={} closing intentionally", source_id_);
        transport->close(network::kNormalClosure, kClientDisconnectReason);
    }

    set_state(ConnectionState::Disconnected);
}

bool ReconnectionController::can_send() const {
    return state_ == ConnectionState::Connected && transport_ && transport_->supports_send();
}

bool ReconnectionController::send_text(const std::string& payload) {
    if (!can_send()) {
        return false;
    }

    auto result = transport_->send_text(payload);
    if (result.is_error()) {
        spdlog::warn("[Connection] source={} send failed: {}", source_id_, result.error().message);
        return false;
    }
    return true;
}

network::TransportHandlers ReconnectionController::make_handlers(std::uint64_t generation) {
    network::TransportHandlers handlers;
    handlers.on_open = [this, generation]() { handle_open(generation); };
    handlers.on_frame = [this, generation](const network::RawFrame& frame) {
        handle_frame(generation, frame);
    };
    handlers.on_error = [this, generation](const std::string& message) {
        handle_error(generation, message);
    };
    handlers.on_close = [this, generation](const network::CloseInfo& info) {
        handle_close(generation, info);
    };
    return handlers;
}

void ReconnectionController::handle_open(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    attempts_ = 0;
    spdlog::info("[Connection] source={} open", source_id_);
    set_state(ConnectionState::Connected);
}

void ReconnectionController::handle_frame(std::uint64_t generation, const network::RawFrame& frame) {
    if (generation != generation_) {
        return;
    }

    spdlog::debug("[Frame] source={} event={} bytes={}",
                  source_id_, frame.event_name.value_or("-"), frame.text.size());
    if (auto on_frame = callbacks_.on_frame) {
        on_frame(frame);
    }
}

void ReconnectionController::handle_error(std::uint64_t generation, const std::string& message) {
    if (generation != generation_) {
        return;
    }

    spdlog::warn("[Connection] source={} transport error: {}", source_id_, message);
    error_reported_ = true;
    report(ClientError(ErrorKind::Transport, message));
}

void ReconnectionController::handle_close(std::uint64_t generation, const network::CloseInfo& info) {
    if (generation != generation_) {
        return;
    }

    const auto closed_generation = ++generation_;
    auto finished = std::move(transport_);
    const bool intentional = info.is_normal() || intentional_close_;

    spdlog::info("[Connection] source={} closed code={} reason='{}'", source_id_, info.code, info.reason);

    if (!set_state(ConnectionState::Disconnected) || closed_generation != generation_) {
        return;
    }

    if (intentional) {
        return;
    }

    if (attempts_ < policy_.max_attempts) {
        // A close frame or a clean end of stream arrives without on_error
        if (!error_reported_) {
            std::string message = "Connection closed with code " + std::to_string(info.code);
            if (!info.reason.empty()) {
                message += ": " + info.reason;
            }
            if (!report(ClientError(ErrorKind::Transport, std::move(message), info.code)) ||
                closed_generation != generation_) {
                return;
            }
        }

        const auto delay = policy_.delay_for(attempts_);
        ++attempts_;
        spdlog::info("[Reconnect] source={} attempt={}/{} delay={}ms",
                     source_id_, attempts_, policy_.max_attempts, delay.count());
        reconnect_timer_ = scheduler_.schedule(delay, [this]() { connect(); });
        return;
    }

    terminal_ = true;
    spdlog::error("[Reconnect] source={} giving up after {} attempts", source_id_, attempts_);
    report(ClientError(ErrorKind::ReconnectExhausted,
                       "Connection lost after " + std::to_string(attempts_) + " reconnect attempts",
                       info.code));
}

bool ReconnectionController::set_state(ConnectionState next) {
    if (state_ == next) {
        return true;
    }

    const auto previous = state_;
    state_ = next;

    auto on_state_change = callbacks_.on_state_change;
    if (!on_state_change) {
        return true;
    }

    std::weak_ptr<char> guard = alive_;
    on_state_change(previous, next);
    return !guard.expired();
}

bool ReconnectionController::report(const ClientError& error) {
    auto on_error = callbacks_.on_error;
    if (!on_error) {
        return true;
    }

    std::weak_ptr<char> guard = alive_;
    on_error(error);
    return !guard.expired();
}

} // namespace syncwatch::client
