#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace syncwatch {

/**
 * @brief Failure categories surfaced through a client's error channel
 *
 * Authentication and ReconnectExhausted are terminal for the controller
 * that raised them. Everything else is reported and the stream carries on.
 */
enum class ErrorKind {
    Authentication,      // No credential when a connection was attempted
    Decode,              // Frame could not be turned into a known message
    Server,              // Server sent a "type": "error" frame
    Transport,           // Network or protocol failure on the channel
    ReconnectExhausted   // Retry bound reached with no successful reopen
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Server: return "server";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::ReconnectExhausted: return "reconnect_exhausted";
    }
    return "unknown";
}

struct ClientError {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    std::optional<std::uint16_t> close_code;  ///< Set when the error came with a transport close

    ClientError() = default;
    ClientError(ErrorKind k, std::string msg, std::optional<std::uint16_t> code = std::nullopt)
        : kind(k), message(std::move(msg)), close_code(code) {}

    [[nodiscard]] bool is_terminal() const noexcept {
        return kind == ErrorKind::Authentication || kind == ErrorKind::ReconnectExhausted;
    }
};

} // namespace syncwatch
