#include "syncwatch/network/endpoint.hpp"

#include <cctype>

namespace syncwatch::network {
namespace {

std::string sources_prefix(const std::string& source_id) {
    return "/api/sources/" + url_encode(source_id) + "/sync";
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string ServerEndpoint::host_header() const {
    if (port == 80) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string ServerEndpoint::websocket_target(const std::string& source_id,
                                             const std::string& token) const {
    return sources_prefix(source_id) + "/progress/ws?token=" + url_encode(token);
}

std::string ServerEndpoint::event_stream_target(const std::string& source_id) const {
    return sources_prefix(source_id) + "/progress";
}

std::string ServerEndpoint::status_target(const std::string& source_id) const {
    return sources_prefix(source_id) + "/status";
}

std::string ServerEndpoint::websocket_url(const std::string& source_id,
                                          const std::string& token) const {
    return std::string("ws://") + host_header() +
           websocket_target(source_id, token);
}

std::string ServerEndpoint::event_stream_url(const std::string& source_id) const {
    return std::string("http://") + host_header() +
           event_stream_target(source_id);
}

std::string ServerEndpoint::status_url(const std::string& source_id) const {
    return std::string("http://") + host_header() +
           status_target(source_id);
}

std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

} // namespace syncwatch::network
