/**
 * @file status_poller.hpp
 * @brief One-shot request/response fallback for progress
 *
 * GET /api/sources/{id}/sync/status answers with the current snapshot, or
 * an empty/null body when no job is running. "No job" is a normal answer
 * (nullopt), never an error.
 */

#pragma once

#include "syncwatch/core/result.hpp"
#include "syncwatch/network/endpoint.hpp"
#include "syncwatch/progress/snapshot.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace syncwatch::client {
class CredentialProvider;
}

namespace syncwatch::network {

using StatusResult = Result<std::optional<progress::ProgressSnapshot>>;

class StatusPoller {
public:
    using Callback = std::function<void(StatusResult)>;

    virtual ~StatusPoller() = default;

    /// Completes exactly once, asynchronously
    virtual void fetch(const std::string& source_id, Callback callback) = 0;
};

/**
 * @brief StatusPoller over plain HTTP/1.1 (Boost.Beast)
 *
 * Sends "Authorization: Bearer <token>". A missing credential fails with
 * ErrorKind::Authentication without touching the network; a non-2xx
 * status or any I/O failure is ErrorKind::Transport.
 */
class HttpStatusPoller : public StatusPoller {
public:
    HttpStatusPoller(boost::asio::io_context& io,
                     ServerEndpoint endpoint,
                     std::shared_ptr<client::CredentialProvider> credentials);

    void fetch(const std::string& source_id, Callback callback) override;

private:
    boost::asio::io_context& io_;
    ServerEndpoint endpoint_;
    std::shared_ptr<client::CredentialProvider> credentials_;
};

} // namespace syncwatch::network
