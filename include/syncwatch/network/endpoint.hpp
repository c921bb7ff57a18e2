#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace syncwatch::network {

/**
 * @brief Location of the backend serving progress streams
 *
 * Builds the request targets for the three delivery mechanisms:
 *   duplex:  /api/sources/{id}/sync/progress/ws?token=<urlencoded>
 *   push:    /api/sources/{id}/sync/progress
 *   poll:    /api/sources/{id}/sync/status
 */
struct ServerEndpoint {
    std::string host = "localhost";
    std::uint16_t port = 8000;

    [[nodiscard]] std::string host_header() const;

    [[nodiscard]] std::string websocket_target(const std::string& source_id,
                                               const std::string& token) const;
    [[nodiscard]] std::string event_stream_target(const std::string& source_id) const;
    [[nodiscard]] std::string status_target(const std::string& source_id) const;

    [[nodiscard]] std::string websocket_url(const std::string& source_id,
                                            const std::string& token) const;
    [[nodiscard]] std::string event_stream_url(const std::string& source_id) const;
    [[nodiscard]] std::string status_url(const std::string& source_id) const;
};

/// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(std::string_view value);

} // namespace syncwatch::network
