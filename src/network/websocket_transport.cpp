#include "syncwatch/network/websocket_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <deque>

namespace syncwatch::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxCloseReason = 123;  // Control frame payload minus the code
}

/**
 * @brief Asynchronous WebSocket client connection
 *
 * LIFETIME:
 * Every pending operation holds a shared_ptr to the session, so the
 * owning WebSocketTransport may be destroyed at any time, including from
 * inside one of the handlers. Once close() is called the handlers are
 * dropped and late completions are ignored.
 */
class WebSocketTransport::Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::io_context& io, std::string host, std::uint16_t port, std::string host_header, std::string target)
        : resolver_(io)
        , ws_(io)
        , host_(std::move(host))
        , port_(port)
        , host_header_(std::move(host_header))
        , target_(std::move(target)) {
    }

    void start(TransportHandlers handlers) {
        handlers_ = std::move(handlers);
        auto self = shared_from_this();

        resolver_.async_resolve(host_, std::to_string(port_),
            [this, self](beast::error_code ec, tcp::resolver::results_type results) {
                on_resolve(ec, std::move(results));
            });
    }

    void close(std::uint16_t code, const std::string& reason) {
        if (closing_ || finished_) {
            return;
        }
        closing_ = true;
        handlers_ = {};

        if (!open_) {
            resolver_.cancel();
            beast::get_lowest_layer(ws_).close();
            return;
        }

        auto self = shared_from_this();
        websocket::close_reason close_reason(static_cast<websocket::close_code>(code),
                                             reason.substr(0, kMaxCloseReason));
        ws_.async_close(close_reason, [self](beast::error_code ec) {
            if (ec) {
                spdlog::debug("[WebSocket] close handshake: {}", ec.message());
            }
        });
    }

    Result<void> send(const std::string& payload) {
        if (!open_ || closing_ || finished_) {
            return Err<void>(ClientError(ErrorKind::Transport, "WebSocket is not open"));
        }

        outbox_.push_back(payload);
        if (!writing_) {
            do_write();
        }
        return Ok();
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail(ec, "resolve");
            return;
        }

        auto self = shared_from_this();
        beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
        beast::get_lowest_layer(ws_).async_connect(results,
            [this, self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }

        // The websocket stream has its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " syncwatch");
        }));

        auto self = shared_from_this();
        ws_.async_handshake(host_header_, target_, [this, self](beast::error_code ec) {
            on_handshake(ec);
        });
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            fail(ec, "handshake");
            return;
        }
        if (closing_) {
            return;
        }

        open_ = true;
        ws_.text(true);
        spdlog::debug("[WebSocket] connected host={} target={}", host_header_, redacted_target());

        if (auto on_open = handlers_.on_open) {
            on_open();
        }
        if (closing_ || finished_) {
            return;
        }
        do_read();
    }

    void do_read() {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [this, self](beast::error_code ec, std::size_t bytes_transferred) {
            on_read(ec, bytes_transferred);
        });
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        if (closing_ || finished_) {
            return;
        }

        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            finish(CloseInfo{static_cast<std::uint16_t>(reason.code),
                             std::string(reason.reason.data(), reason.reason.size())});
            return;
        }
        if (ec) {
            fail(ec, "read");
            return;
        }

        RawFrame frame;
        frame.text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(bytes_transferred);

        if (auto on_frame = handlers_.on_frame) {
            on_frame(frame);
        }
        if (closing_ || finished_) {
            return;
        }
        do_read();
    }

    void do_write() {
        writing_ = true;
        auto self = shared_from_this();
        ws_.async_write(asio::buffer(outbox_.front()),
            [this, self](beast::error_code ec, std::size_t) {
                writing_ = false;
                if (ec) {
                    fail(ec, "write");
                    return;
                }
                outbox_.pop_front();
                if (!outbox_.empty() && !closing_ && !finished_) {
                    do_write();
                }
            });
    }

    void fail(beast::error_code ec, const char* what) {
        if (closing_ || finished_ || ec == asio::error::operation_aborted) {
            return;
        }

        const std::string message = std::string("websocket ") + what + ": " + ec.message();
        if (auto on_error = handlers_.on_error) {
            on_error(message);
        }
        if (closing_ || finished_) {
            return;
        }

        beast::get_lowest_layer(ws_).close();
        finish(CloseInfo{kAbnormalClosure, message});
    }

    void finish(const CloseInfo& info) {
        finished_ = true;
        open_ = false;
        auto on_close = std::move(handlers_.on_close);
        handlers_ = {};
        if (on_close) {
            on_close(info);
        }
    }

    // Keeps the token out of the logs
    std::string redacted_target() const {
        return target_.substr(0, target_.find('?'));
    }

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;

    std::string host_;
    std::uint16_t port_;
    std::string host_header_;
    std::string target_;

    TransportHandlers handlers_;
    bool open_ = false;
    bool writing_ = false;
    bool closing_ = false;   // Owner called close()
    bool finished_ = false;  // on_close delivered
};

WebSocketTransport::WebSocketTransport(asio::io_context& io,
                                       const ServerEndpoint& endpoint,
                                       const TransportRequest& request)
    : session_(std::make_shared<Session>(io,
                                         endpoint.host,
                                         endpoint.port,
                                         endpoint.host_header(),
                                         endpoint.websocket_target(request.source_id, request.bearer_token))) {
}

WebSocketTransport::~WebSocketTransport() {
    session_->close(kNormalClosure, "Client disconnect");
}

void WebSocketTransport::open(TransportHandlers handlers) {
    session_->start(std::move(handlers));
}

void WebSocketTransport::close(std::uint16_t code, const std::string& reason) {
    session_->close(code, reason);
}

Result<void> WebSocketTransport::send_text(const std::string& payload) {
    return session_->send(payload);
}

TransportFactory make_websocket_factory(asio::io_context& io, ServerEndpoint endpoint) {
    return [&io, endpoint = std::move(endpoint)](const TransportRequest& request) -> std::unique_ptr<Transport> {
        return std::make_unique<WebSocketTransport>(io, endpoint, request);
    };
}

} // namespace syncwatch::network
