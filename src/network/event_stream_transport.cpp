#include "syncwatch/network/event_stream_transport.hpp"
#include "syncwatch/network/event_stream_parser.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <optional>

namespace syncwatch::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(30);
constexpr std::size_t kReadChunkSize = 8192;
}

/**
 * @brief One long-lived GET whose body is parsed as it arrives
 *
 * Same lifetime rules as the WebSocket session: pending operations own
 * the session, close() drops the handlers.
 */
class EventStreamTransport::Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::io_context& io, std::string host, std::uint16_t port, std::string host_header,
            std::string target, std::string bearer_token)
        : resolver_(io)
        , stream_(io)
        , host_(std::move(host))
        , port_(port) {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(target);
        request_.set(http::field::host, host_header);
        request_.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " syncwatch");
        request_.set(http::field::accept, "text/event-stream");
        request_.set(http::field::cache_control, "no-cache");
        if (!bearer_token.empty()) {
            request_.set(http::field::authorization, "Bearer " + bearer_token);
        }
    }

    void start(TransportHandlers handlers) {
        handlers_ = std::move(handlers);
        auto self = shared_from_this();

        resolver_.async_resolve(host_, std::to_string(port_),
            [this, self](beast::error_code ec, tcp::resolver::results_type results) {
                on_resolve(ec, std::move(results));
            });
    }

    void close() {
        if (closing_ || finished_) {
            return;
        }
        closing_ = true;
        handlers_ = {};

        resolver_.cancel();
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail(ec, "resolve");
            return;
        }

        auto self = shared_from_this();
        stream_.expires_after(kConnectTimeout);
        stream_.async_connect(results,
            [this, self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }

        auto self = shared_from_this();
        http::async_write(stream_, request_, [this, self](beast::error_code ec, std::size_t) {
            on_write(ec);
        });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            fail(ec, "write");
            return;
        }

        parser_.emplace();
        parser_->body_limit(boost::none);

        auto self = shared_from_this();
        http::async_read_header(stream_, buffer_, *parser_, [this, self](beast::error_code ec, std::size_t) {
            on_header(ec);
        });
    }

    void on_header(beast::error_code ec) {
        if (ec) {
            fail(ec, "read header");
            return;
        }
        if (closing_) {
            return;
        }

        const auto status = parser_->get().result_int();
        if (status != 200) {
            fail_with("event stream returned HTTP " + std::to_string(status));
            return;
        }

        // Progress can be silent for a long time; heartbeats keep it honest
        stream_.expires_never();
        spdlog::debug("[EventStream] connected target={}", request_.target().to_string());

        if (auto on_open = handlers_.on_open) {
            on_open();
        }
        if (closing_ || finished_) {
            return;
        }
        do_read();
    }

    void do_read() {
        auto& body = parser_->get().body();
        body.data = chunk_.data();
        body.size = chunk_.size();

        auto self = shared_from_this();
        http::async_read_some(stream_, buffer_, *parser_, [this, self](beast::error_code ec, std::size_t) {
            on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (closing_ || finished_) {
            return;
        }

        // Chunk buffer full; not an error
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec == http::error::end_of_stream || ec == asio::error::eof) {
            finish(CloseInfo{kAbnormalClosure, "event stream ended"});
            return;
        }
        if (ec) {
            fail(ec, "read");
            return;
        }

        const std::size_t received = chunk_.size() - parser_->get().body().size;
        auto parsed = events_.feed(chunk_.data(), received);
        if (parsed.is_error()) {
            fail_with("event stream: " + parsed.error());
            return;
        }

        for (const auto& message : parsed.value()) {
            RawFrame frame;
            if (message.event != "message") {
                frame.event_name = message.event;
            }
            frame.text = message.data;

            if (auto on_frame = handlers_.on_frame) {
                on_frame(frame);
            }
            if (closing_ || finished_) {
                return;
            }
        }

        if (parser_->is_done()) {
            finish(CloseInfo{kAbnormalClosure, "event stream ended"});
            return;
        }
        do_read();
    }

    void fail(beast::error_code ec, const char* what) {
        if (closing_ || finished_ || ec == asio::error::operation_aborted) {
            return;
        }
        fail_with(std::string("event stream ") + what + ": " + ec.message());
    }

    void fail_with(const std::string& message) {
        if (auto on_error = handlers_.on_error) {
            on_error(message);
        }
        if (closing_ || finished_) {
            return;
        }

        stream_.close();
        finish(CloseInfo{kAbnormalClosure, message});
    }

    void finish(const CloseInfo& info) {
        finished_ = true;
        auto on_close = std::move(handlers_.on_close);
        handlers_ = {};
        if (on_close) {
            on_close(info);
        }
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    std::optional<http::response_parser<http::buffer_body>> parser_;
    std::array<char, kReadChunkSize> chunk_{};
    EventStreamParser events_;

    std::string host_;
    std::uint16_t port_;

    TransportHandlers handlers_;
    bool closing_ = false;
    bool finished_ = false;
};

EventStreamTransport::EventStreamTransport(asio::io_context& io,
                                           const ServerEndpoint& endpoint,
                                           const TransportRequest& request)
    : session_(std::make_shared<Session>(io,
                                         endpoint.host,
                                         endpoint.port,
                                         endpoint.host_header(),
                                         endpoint.event_stream_target(request.source_id),
                                         request.bearer_token)) {
}

EventStreamTransport::~EventStreamTransport() {
    session_->close();
}

void EventStreamTransport::open(TransportHandlers handlers) {
    session_->start(std::move(handlers));
}

void EventStreamTransport::close(std::uint16_t, const std::string&) {
    session_->close();
}

Result<void> EventStreamTransport::send_text(const std::string&) {
    return Err<void>(ClientError(ErrorKind::Transport, "event stream transport is receive-only"));
}

TransportFactory make_event_stream_factory(asio::io_context& io, ServerEndpoint endpoint) {
    return [&io, endpoint = std::move(endpoint)](const TransportRequest& request) -> std::unique_ptr<Transport> {
        return std::make_unique<EventStreamTransport>(io, endpoint, request);
    };
}

} // namespace syncwatch::network
