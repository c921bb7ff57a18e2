#pragma once

namespace syncwatch::client {

enum class ConnectionState {
    Connecting,
    Connected,
    Disconnected
};

inline const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

} // namespace syncwatch::client
