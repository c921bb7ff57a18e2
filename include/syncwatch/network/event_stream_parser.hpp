#pragma once

#include "syncwatch/core/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace syncwatch::network {

/**
 * @brief One dispatched text/event-stream event
 *
 * event defaults to "message" when the stream gave no "event:" field.
 */
struct EventStreamMessage {
    std::string event = "message";
    std::string data;
    std::string last_event_id;
};

/**
 * @brief Line states for the text/event-stream format
 *
 * Stream format (one event):
 * event: progress CRLF        <- optional, names the event
 * data: {"phase": ...} CRLF   <- one or more, joined with '\n'
 * id: 42 CRLF                 <- optional
 * retry: 3000 CRLF            <- ignored
 * : comment CRLF              <- ignored
 * CRLF                        <- blank line dispatches the event
 *
 * Lines may end in CR, LF or CRLF, and a CRLF may be split across two
 * network reads.
 */
enum class StreamParseState {
    LINE,          // Accumulating the current line
    AFTER_CR,      // Saw CR; an LF right now belongs to the same line ending
    STREAM_ERROR   // Line limit exceeded; parser must be reset
};

/**
 * @brief Incremental text/event-stream parser
 *
 * Feed it body bytes as they arrive; it returns the events completed by
 * that chunk. Partial lines and partial events are carried over.
 *
 * Usage example:
 * ```cpp
 * EventStreamParser parser;
 * auto result = parser.feed(chunk.data(), chunk.size());
 * if (result.is_error()) { ... }
 * for (auto& message : result.value()) { ... }
 * ```
 */
class EventStreamParser {
public:
    static constexpr std::size_t kDefaultMaxLineLength = 1024 * 1024;

    explicit EventStreamParser(std::size_t max_line_length = kDefaultMaxLineLength)
        : max_line_length_(max_line_length) {
        reset();
    }

    Result<std::vector<EventStreamMessage>, std::string> feed(const char* data, std::size_t len) {
        std::vector<EventStreamMessage> dispatched;

        for (std::size_t i = 0; i < len; ++i) {
            const char c = data[i];

            switch (state_) {
                case StreamParseState::STREAM_ERROR:
                    return Err<std::vector<EventStreamMessage>, std::string>(
                        std::string("Parser in error state"));

                case StreamParseState::AFTER_CR:
                    state_ = StreamParseState::LINE;
                    if (c == '\n') {
                        continue;  // CRLF: line already processed at CR
                    }
                    [[fallthrough]];

                case StreamParseState::LINE:
                    if (c == '\r' || c == '\n') {
                        process_line(dispatched);
                        state_ = (c == '\r') ? StreamParseState::AFTER_CR : StreamParseState::LINE;
                    } else {
                        line_.push_back(c);
                        if (line_.size() > max_line_length_) {
                            state_ = StreamParseState::STREAM_ERROR;
                            return Err<std::vector<EventStreamMessage>, std::string>(
                                "Event stream line exceeds " + std::to_string(max_line_length_) + " bytes");
                        }
                    }
                    break;
            }
        }

        return Ok<std::vector<EventStreamMessage>, std::string>(std::move(dispatched));
    }

    [[nodiscard]] const std::string& last_event_id() const { return last_event_id_; }

    void reset() {
        state_ = StreamParseState::LINE;
        line_.clear();
        data_.clear();
        event_type_.clear();
        last_event_id_.clear();
        at_stream_start_ = true;
    }

private:
    StreamParseState state_;
    std::size_t max_line_length_;
    std::string line_;            // Current line without terminator
    std::string data_;            // Data buffer for the pending event
    std::string event_type_;      // Pending "event:" value
    std::string last_event_id_;   // Persists across events
    bool at_stream_start_;        // For stripping a leading UTF-8 BOM

    void process_line(std::vector<EventStreamMessage>& dispatched) {
        if (at_stream_start_) {
            at_stream_start_ = false;
            if (line_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
                line_.erase(0, 3);
            }
        }

        if (line_.empty()) {
            dispatch(dispatched);
            return;
        }

        if (line_.front() == ':') {
            line_.clear();  // Comment
            return;
        }

        std::string field;
        std::string value;
        const auto colon = line_.find(':');
        if (colon == std::string::npos) {
            field = line_;
        } else {
            field = line_.substr(0, colon);
            std::size_t value_start = colon + 1;
            if (value_start < line_.size() && line_[value_start] == ' ') {
                ++value_start;
            }
            value = line_.substr(value_start);
        }
        line_.clear();

        if (field == "event") {
            event_type_ = value;
        } else if (field == "data") {
            data_ += value;
            data_.push_back('\n');
        } else if (field == "id") {
            if (value.find('\0') == std::string::npos) {
                last_event_id_ = value;
            }
        }
        // "retry" and unknown fields are ignored; the reconnect schedule is the controller's
    }

    void dispatch(std::vector<EventStreamMessage>& dispatched) {
        if (data_.empty()) {
            event_type_.clear();
            return;
        }

        data_.pop_back();  // Trailing '\n' from the last data line

        EventStreamMessage message;
        message.event = event_type_.empty() ? std::string("message") : event_type_;
        message.data = std::move(data_);
        message.last_event_id = last_event_id_;
        dispatched.push_back(std::move(message));

        data_.clear();
        event_type_.clear();
    }
};

} // namespace syncwatch::network
