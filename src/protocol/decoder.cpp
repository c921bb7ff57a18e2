#include "syncwatch/protocol/decoder.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace syncwatch::protocol {
namespace {

using json = nlohmann::json;
using FieldNames = std::initializer_list<const char*>;

ClientError decode_error(const std::string& message) {
    return ClientError{ErrorKind::Decode, "decode failure: " + message};
}

// First present, non-null field among the accepted spellings
const json* find_field(const json& object, FieldNames names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

Result<std::uint64_t> read_count(const json& object, FieldNames names) {
    const json* field = find_field(object, names);
    if (field == nullptr) {
        return Ok<std::uint64_t>(0);
    }
    if (field->is_number_unsigned()) {
        return Ok(field->get<std::uint64_t>());
    }
    if (field->is_number_integer()) {
        const auto value = field->get<std::int64_t>();
        if (value < 0) {
            return Err<std::uint64_t>(decode_error(std::string(*names.begin()) + " is negative"));
        }
        return Ok(static_cast<std::uint64_t>(value));
    }
    return Err<std::uint64_t>(decode_error(std::string(*names.begin()) + " is not an integer"));
}

Result<std::optional<std::uint64_t>> read_optional_count(const json& object,
                                                         FieldNames names) {
    if (find_field(object, names) == nullptr) {
        return Ok(std::optional<std::uint64_t>{});
    }
    auto value = read_count(object, names);
    if (value.is_error()) {
        return Err<std::optional<std::uint64_t>>(value.error());
    }
    return Ok(std::optional<std::uint64_t>{value.value()});
}

Result<double> read_non_negative(const json& object, FieldNames names) {
    const json* field = find_field(object, names);
    if (field == nullptr) {
        return Ok(0.0);
    }
    if (!field->is_number()) {
        return Err<double>(decode_error(std::string(*names.begin()) + " is not a number"));
    }
    const auto value = field->get<double>();
    if (value < 0.0) {
        return Err<double>(decode_error(std::string(*names.begin()) + " is negative"));
    }
    return Ok(value);
}

Result<std::optional<std::string>> read_optional_string(const json& object,
                                                        FieldNames names) {
    const json* field = find_field(object, names);
    if (field == nullptr) {
        return Ok(std::optional<std::string>{});
    }
    if (!field->is_string()) {
        return Err<std::optional<std::string>>(decode_error(std::string(*names.begin()) + " is not a string"));
    }
    auto text = field->get<std::string>();
    if (text.empty()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>{std::move(text)});
}

std::int64_t read_timestamp(const json& object) {
    const json* field = find_field(object, {"timestamp"});
    if (field != nullptr && field->is_number_integer()) {
        return field->get<std::int64_t>();
    }
    return 0;
}

Result<bool> read_flag(const json& object, FieldNames names) {
    const json* field = find_field(object, names);
    if (field == nullptr) {
        return Ok(false);
    }
    if (!field->is_boolean()) {
        return Err<bool>(decode_error(std::string(*names.begin()) + " is not a boolean"));
    }
    return Ok(field->get<bool>());
}

Result<progress::ProgressSnapshot> parse_snapshot(const json& data, const std::string& fallback_source) {
    if (!data.is_object()) {
        return Err<progress::ProgressSnapshot>(decode_error("progress payload is not an object"));
    }

    const json* phase_field = find_field(data, {"phase"});
    if (phase_field == nullptr || !phase_field->is_string()) {
        return Err<progress::ProgressSnapshot>(decode_error("progress payload has no phase"));
    }
    const auto phase_name = phase_field->get<std::string>();
    const auto phase = progress::parse_phase(phase_name);
    if (!phase) {
        return Err<progress::ProgressSnapshot>(decode_error("unrecognized phase '" + phase_name + "'"));
    }

    progress::ProgressSnapshot snapshot;
    snapshot.phase = *phase;

    auto source = read_optional_string(data, {"source_id", "sourceId"});
    if (source.is_error()) return Err<progress::ProgressSnapshot>(source.error());
    snapshot.source_id = source.value().value_or(fallback_source);

    auto description = read_optional_string(data, {"phase_description", "phaseDescription"});
    if (description.is_error()) return Err<progress::ProgressSnapshot>(description.error());
    snapshot.phase_description = description.value().value_or(progress::default_description(*phase));

    std::optional<ClientError> failure;
    auto count = [&](std::uint64_t& target, FieldNames names) {
        if (failure) {
            return;
        }
        auto value = read_count(data, names);
        if (value.is_error()) {
            failure = value.error();
        } else {
            target = value.value();
        }
    };
    count(snapshot.elapsed_seconds, {"elapsed_time_secs", "elapsedSeconds"});
    count(snapshot.directories_found, {"directories_found", "directoriesFound"});
    count(snapshot.directories_processed, {"directories_processed", "directoriesProcessed"});
    count(snapshot.files_found, {"files_found", "filesFound"});
    count(snapshot.files_processed, {"files_processed", "filesProcessed"});
    count(snapshot.bytes_processed, {"bytes_processed", "bytesProcessed"});
    count(snapshot.errors, {"errors"});
    count(snapshot.warnings, {"warnings"});
    if (failure) {
        return Err<progress::ProgressSnapshot>(*failure);
    }

    auto rate = read_non_negative(data, {"processing_rate_files_per_sec", "processingRateFilesPerSec"});
    if (rate.is_error()) return Err<progress::ProgressSnapshot>(rate.error());
    snapshot.processing_rate_files_per_sec = rate.value();

    auto percent = read_non_negative(data, {"files_progress_percent", "filesProgressPercent"});
    if (percent.is_error()) return Err<progress::ProgressSnapshot>(percent.error());
    snapshot.files_progress_percent = std::min(percent.value(), 100.0);

    auto remaining = read_optional_count(data, {"estimated_time_remaining_secs", "estimatedSecondsRemaining"});
    if (remaining.is_error()) return Err<progress::ProgressSnapshot>(remaining.error());
    snapshot.estimated_seconds_remaining = remaining.value();

    auto directory = read_optional_string(data, {"current_directory", "currentDirectory"});
    if (directory.is_error()) return Err<progress::ProgressSnapshot>(directory.error());
    snapshot.current_directory = std::move(directory.value());

    auto file = read_optional_string(data, {"current_file", "currentFile"});
    if (file.is_error()) return Err<progress::ProgressSnapshot>(file.error());
    snapshot.current_file = std::move(file.value());

    // The server's is_active flag is ignored: activity follows the phase
    return Ok(std::move(snapshot));
}

Result<StreamMessage> decode_typed(const std::string& type, const json& payload,
                                   const std::string& fallback_source) {
    if (!payload.is_object()) {
        return Err<StreamMessage>(decode_error("'" + type + "' payload is not an object"));
    }

    if (type == "progress") {
        auto snapshot = parse_snapshot(payload, fallback_source);
        if (snapshot.is_error()) {
            return Err<StreamMessage>(snapshot.error());
        }
        return Ok<StreamMessage>(ProgressMessage{std::move(snapshot.value())});
    }

    auto source = read_optional_string(payload, {"source_id", "sourceId"});
    if (source.is_error()) return Err<StreamMessage>(source.error());
    std::string source_id = source.value().value_or(fallback_source);

    if (type == "heartbeat") {
        HeartbeatMessage heartbeat;
        heartbeat.source_id = std::move(source_id);
        auto active = read_flag(payload, {"is_active", "isActive"});
        if (active.is_error()) return Err<StreamMessage>(active.error());
        heartbeat.is_active = active.value();
        heartbeat.timestamp = read_timestamp(payload);
        return Ok<StreamMessage>(heartbeat);
    }

    if (type == "connected" || type == "connection_confirmed") {
        ConnectedMessage connected;
        connected.source_id = std::move(source_id);
        connected.timestamp = read_timestamp(payload);
        return Ok<StreamMessage>(connected);
    }

    if (type == "error") {
        ServerErrorMessage error;
        auto message = read_optional_string(payload, {"message"});
        if (message.is_error()) return Err<StreamMessage>(message.error());
        error.message = message.value().value_or("Unspecified server error");
        auto error_type = read_optional_string(payload, {"error_type", "errorType"});
        if (error_type.is_error()) return Err<StreamMessage>(error_type.error());
        error.error_type = error_type.value();
        auto details = read_optional_string(payload, {"details"});
        if (details.is_error()) return Err<StreamMessage>(details.error());
        error.details = details.value();
        return Ok<StreamMessage>(error);
    }

    if (type == "connection_closing") {
        ClosingMessage closing;
        closing.source_id = std::move(source_id);
        auto message = read_optional_string(payload, {"message"});
        if (message.is_error()) return Err<StreamMessage>(message.error());
        closing.message = message.value().value_or("");
        closing.timestamp = read_timestamp(payload);
        return Ok<StreamMessage>(closing);
    }

    return Err<StreamMessage>(decode_error("unknown message type '" + type + "'"));
}

} // namespace

MessageDecoder::MessageDecoder(std::string source_id)
    : source_id_(std::move(source_id)) {
}

Result<StreamMessage> MessageDecoder::decode(const network::RawFrame& frame) const {
    json root = json::parse(frame.text, nullptr, false);
    if (root.is_discarded()) {
        return Err<StreamMessage>(decode_error("frame is not valid JSON"));
    }

    try {
        // Push stream: the event name is the type and the frame is the bare payload,
        // unless the server sent a full envelope anyway
        if (frame.event_name && *frame.event_name != "message") {
            const bool is_envelope = root.is_object() && root.contains("type") &&
                                     root["type"].is_string() &&
                                     root["type"].get<std::string>() == *frame.event_name &&
                                     root.contains("data");
            return decode_typed(*frame.event_name, is_envelope ? root["data"] : root, source_id_);
        }

        if (!root.is_object()) {
            return Err<StreamMessage>(decode_error("frame is not a JSON object"));
        }
        auto type_it = root.find("type");
        if (type_it == root.end() || !type_it->is_string()) {
            return Err<StreamMessage>(decode_error("frame has no type discriminant"));
        }

        // Some frames put their fields next to "type" instead of under "data"
        auto data_it = root.find("data");
        const json& payload = data_it != root.end() ? *data_it : root;
        return decode_typed(type_it->get<std::string>(), payload, source_id_);
    } catch (const json::exception& e) {
        return Err<StreamMessage>(decode_error(e.what()));
    }
}

Result<std::optional<progress::ProgressSnapshot>>
MessageDecoder::decode_status_body(const std::string& body) const {
    using Snapshot = std::optional<progress::ProgressSnapshot>;

    const bool blank = std::all_of(body.begin(), body.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        return Ok(Snapshot{});
    }

    json root = json::parse(body, nullptr, false);
    if (root.is_discarded()) {
        return Err<Snapshot>(decode_error("status body is not valid JSON"));
    }
    if (root.is_null()) {
        return Ok(Snapshot{});
    }

    try {
        auto snapshot = parse_snapshot(root, source_id_);
        if (snapshot.is_error()) {
            return Err<Snapshot>(snapshot.error());
        }
        spdlog::debug("Status poll for {}: phase={}", source_id_,
                      progress::to_string(snapshot.value().phase));
        return Ok(Snapshot{std::move(snapshot.value())});
    } catch (const json::exception& e) {
        return Err<Snapshot>(decode_error(e.what()));
    }
}

} // namespace syncwatch::protocol
