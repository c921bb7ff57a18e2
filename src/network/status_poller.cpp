#include "syncwatch/network/status_poller.hpp"
#include "syncwatch/client/credentials.hpp"
#include "syncwatch/protocol/decoder.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace syncwatch::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(30);

/**
 * @brief One GET /status round trip
 *
 * Owns itself through its pending operations and completes the callback
 * exactly once.
 */
class StatusRequest : public std::enable_shared_from_this<StatusRequest> {
public:
    StatusRequest(asio::io_context& io, const ServerEndpoint& endpoint, const std::string& source_id,
                  const std::string& bearer_token, StatusPoller::Callback callback)
        : resolver_(io)
        , stream_(io)
        , host_(endpoint.host)
        , port_(endpoint.port)
        , decoder_(source_id)
        , callback_(std::move(callback)) {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(endpoint.status_target(source_id));
        request_.set(http::field::host, endpoint.host_header());
        request_.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " syncwatch");
        request_.set(http::field::accept, "application/json");
        request_.set(http::field::authorization, "Bearer " + bearer_token);
    }

    void start() {
        auto self = shared_from_this();
        resolver_.async_resolve(host_, std::to_string(port_),
            [this, self](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail(ec, "resolve");
                    return;
                }
                stream_.expires_after(kRequestTimeout);
                stream_.async_connect(results,
                    [this, self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        on_connect(ec);
                    });
            });
    }

private:
    void on_connect(beast::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }

        auto self = shared_from_this();
        http::async_write(stream_, request_, [this, self](beast::error_code ec, std::size_t) {
            if (ec) {
                fail(ec, "write");
                return;
            }
            http::async_read(stream_, buffer_, response_, [this, self](beast::error_code ec, std::size_t) {
                on_read(ec);
            });
        });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            fail(ec, "read");
            return;
        }

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const auto status = response_.result_int();
        spdlog::debug("[StatusPoller] {} -> {} ({} bytes)",
                      request_.target().to_string(), status, response_.body().size());

        if (status < 200 || status >= 300) {
            complete(Err<std::optional<progress::ProgressSnapshot>>(ClientError(
                ErrorKind::Transport, "status endpoint returned HTTP " + std::to_string(status))));
            return;
        }

        complete(decoder_.decode_status_body(response_.body()));
    }

    void fail(beast::error_code ec, const char* what) {
        complete(Err<std::optional<progress::ProgressSnapshot>>(ClientError(
            ErrorKind::Transport, std::string("status request ") + what + ": " + ec.message())));
    }

    void complete(StatusResult result) {
        if (auto callback = std::move(callback_)) {
            callback_ = nullptr;
            callback(std::move(result));
        }
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;

    std::string host_;
    std::uint16_t port_;
    protocol::MessageDecoder decoder_;
    StatusPoller::Callback callback_;
};

} // namespace

HttpStatusPoller::HttpStatusPoller(asio::io_context& io,
                                   ServerEndpoint endpoint,
                                   std::shared_ptr<client::CredentialProvider> credentials)
    : io_(io)
    , endpoint_(std::move(endpoint))
    , credentials_(std::move(credentials)) {
}

void HttpStatusPoller::fetch(const std::string& source_id, Callback callback) {
    auto token = credentials_ ? credentials_->bearer_token() : std::nullopt;
    if (!token) {
        spdlog::error("[StatusPoller] source={} no credential available", source_id);
        asio::post(io_, [callback = std::move(callback)]() {
            callback(Err<std::optional<progress::ProgressSnapshot>>(
                ClientError(ErrorKind::Authentication, "No authentication credential available")));
        });
        return;
    }

    std::make_shared<StatusRequest>(io_, endpoint_, source_id, *token, std::move(callback))->start();
}

} // namespace syncwatch::network
