#pragma once

#include "syncwatch/core/result.hpp"
#include "syncwatch/network/transport.hpp"
#include "syncwatch/protocol/messages.hpp"

#include <optional>
#include <string>

namespace syncwatch::protocol {

/**
 * @brief Turns raw frames into typed stream messages
 *
 * Accepts the envelope {"type": ..., "data": {...}} from the duplex
 * channel, and bare payloads under a named event from the push stream.
 * Any frame that is not valid JSON, has an unknown type, names an unknown
 * phase, or carries a field of the wrong type or sign yields a
 * ErrorKind::Decode error and no message. Nothing is partially applied.
 *
 * Field names are read in the backend's snake_case form first, then the
 * camelCase form (source_id / sourceId, elapsed_time_secs / elapsedSeconds...).
 */
class MessageDecoder {
public:
    /// source_id fills in messages that do not name their source
    explicit MessageDecoder(std::string source_id);

    [[nodiscard]] Result<StreamMessage> decode(const network::RawFrame& frame) const;

    /// Poll response body: a snapshot, or nullopt for an empty/null body
    [[nodiscard]] Result<std::optional<progress::ProgressSnapshot>>
    decode_status_body(const std::string& body) const;

    [[nodiscard]] const std::string& source_id() const noexcept { return source_id_; }

private:
    std::string source_id_;
};

} // namespace syncwatch::protocol
