/**
 * @file transport.hpp
 * @brief Delivery channel abstraction for progress frames
 *
 * WHY THIS FILE EXISTS:
 * The duplex (WebSocket) and push-stream (text/event-stream) channels
 * deliver the same frames with the same close semantics. The reconnection
 * controller only talks to this interface and never knows which one it
 * owns.
 *
 * CALLBACK CONTRACT:
 * - open() never invokes a handler before it returns
 * - on_open once the channel is ready to deliver frames
 * - on_frame for every complete text frame, in arrival order
 * - on_error for failures; does not by itself end the channel
 * - on_close exactly once, last; no callback fires after it
 * - after close() is called by the owner, no callback fires at all
 */

#pragma once

#include "syncwatch/core/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace syncwatch::network {

constexpr std::uint16_t kNormalClosure = 1000;
constexpr std::uint16_t kAbnormalClosure = 1006;

enum class TransportKind {
    WebSocket,
    EventStream
};

inline const char* to_string(TransportKind kind) {
    return kind == TransportKind::WebSocket ? "websocket" : "event-stream";
}

/**
 * @brief One text frame as received
 *
 * event_name is the text/event-stream "event:" field when the stream
 * provides one. WebSocket frames never have it.
 */
struct RawFrame {
    std::optional<std::string> event_name;
    std::string text;
};

struct CloseInfo {
    std::uint16_t code = kAbnormalClosure;
    std::string reason;

    [[nodiscard]] bool is_normal() const noexcept { return code == kNormalClosure; }
};

struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const RawFrame&)> on_frame;
    std::function<void(const std::string&)> on_error;
    std::function<void(const CloseInfo&)> on_close;
};

/// What a factory needs to open a channel for one subscription
struct TransportRequest {
    std::string source_id;
    std::string bearer_token;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportKind kind() const noexcept = 0;

    /// Starts connecting; progress is reported through handlers. Call once.
    virtual void open(TransportHandlers handlers) = 0;

    /// Intentional close; silences all further callbacks
    virtual void close(std::uint16_t code, const std::string& reason) = 0;

    virtual bool supports_send() const noexcept = 0;

    virtual Result<void> send_text(const std::string& payload) = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const TransportRequest&)>;

} // namespace syncwatch::network
