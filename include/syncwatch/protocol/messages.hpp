/**
 * @file messages.hpp
 * @brief Typed messages decoded from progress-stream frames
 *
 * Every frame carries a "type" discriminant. Each recognised type maps to
 * one struct below; StreamMessage is the closed set the decoder can return.
 */

#pragma once

#include "syncwatch/progress/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace syncwatch::protocol {

/// "progress": replaces the stored snapshot for the source
struct ProgressMessage {
    progress::ProgressSnapshot snapshot;
};

/// "heartbeat": liveness only, never touches the stored snapshot
struct HeartbeatMessage {
    std::string source_id;
    bool is_active = false;
    std::int64_t timestamp = 0;
};

/// "connected" / "connection_confirmed": server accepted the subscription
struct ConnectedMessage {
    std::string source_id;
    std::int64_t timestamp = 0;
};

/// "error": server-side problem, forwarded verbatim
struct ServerErrorMessage {
    std::string message;
    std::optional<std::string> error_type;   // e.g. "serialization_error"
    std::optional<std::string> details;
};

/// "connection_closing": server is about to end the stream
struct ClosingMessage {
    std::string source_id;
    std::string message;
    std::int64_t timestamp = 0;
};

using StreamMessage = std::variant<
    ProgressMessage,
    HeartbeatMessage,
    ConnectedMessage,
    ServerErrorMessage,
    ClosingMessage
>;

} // namespace syncwatch::protocol
