/**
 * @file watch_sync_progress.cpp
 * @brief Follows one sync job from the command line
 *
 * Prints a one-line summary per snapshot and exits when the job ends:
 *   0  job completed
 *   1  job failed, or the client gave up (no credential, retries exhausted)
 *   130 interrupted with Ctrl+C
 *
 * Usage:
 *   watch_sync_progress --source 42 --token-env SYNC_TOKEN
 *   watch_sync_progress --source 42 --transport sse --token abc --verbose
 *   watch_sync_progress --source 42 --transport poll --poll-sec 5 --token abc
 */

#include "syncwatch/client/credentials.hpp"
#include "syncwatch/client/progress_client.hpp"
#include "syncwatch/client/scheduler.hpp"
#include "syncwatch/events/components.hpp"
#include "syncwatch/network/endpoint.hpp"
#include "syncwatch/network/event_stream_transport.hpp"
#include "syncwatch/network/status_poller.hpp"
#include "syncwatch/network/websocket_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

using namespace syncwatch;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --source ID [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --host HOST           Backend host (default: localhost)\n";
    std::cout << "  --port PORT           Backend port (default: 8000)\n";
    std::cout << "  --source ID           Source whose sync job to follow (required)\n";
    std::cout << "  --transport KIND      ws | sse | poll (default: ws)\n";
    std::cout << "  --token TOKEN         Bearer credential\n";
    std::cout << "  --token-env VAR       Read the credential from VAR on every connect\n";
    std::cout << "  --max-attempts N      Reconnect attempts before giving up (default: 5)\n";
    std::cout << "  --base-delay-ms MS    First reconnect delay, doubled per attempt (default: 1000)\n";
    std::cout << "  --keepalive-sec S     Ping interval on ws, 0 disables (default: 30)\n";
    std::cout << "  --poll-sec S          Poll interval for --transport poll (default: 2)\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --help                Show this help message\n";
}

void print_snapshot(const progress::ProgressSnapshot& s) {
    std::cout << "[" << progress::to_string(s.phase) << "] "
              << s.phase_description
              << " | files " << s.files_processed << "/" << s.files_found
              << " | dirs " << s.directories_processed << "/" << s.directories_found
              << " | " << static_cast<int>(s.files_progress_percent) << "%";
    if (s.estimated_seconds_remaining) {
        std::cout << " | eta " << *s.estimated_seconds_remaining << "s";
    }
    if (s.current_file) {
        std::cout << " | " << *s.current_file;
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    network::ServerEndpoint endpoint;
    std::string source_id;
    std::string transport = "ws";
    std::string token;
    std::string token_env;
    client::ClientOptions options;
    int poll_seconds = 2;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--host" && i + 1 < argc) {
                endpoint.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                endpoint.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--source" && i + 1 < argc) {
                source_id = argv[++i];
            } else if (arg == "--transport" && i + 1 < argc) {
                transport = argv[++i];
            } else if (arg == "--token" && i + 1 < argc) {
                token = argv[++i];
            } else if (arg == "--token-env" && i + 1 < argc) {
                token_env = argv[++i];
            } else if (arg == "--max-attempts" && i + 1 < argc) {
                options.reconnect.max_attempts = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--base-delay-ms" && i + 1 < argc) {
                options.reconnect.base_delay = std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (arg == "--keepalive-sec" && i + 1 < argc) {
                options.keepalive_interval = std::chrono::seconds(std::stol(argv[++i]));
            } else if (arg == "--poll-sec" && i + 1 < argc) {
                poll_seconds = std::stoi(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                spdlog::set_level(spdlog::level::debug);
            } else {
                spdlog::error("Unknown or incomplete option: {}", arg);
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid option value: {}", e.what());
        return 1;
    }

    if (source_id.empty()) {
        spdlog::error("--source is required");
        print_usage(argv[0]);
        return 1;
    }
    if (transport != "ws" && transport != "sse" && transport != "poll") {
        spdlog::error("Unknown transport: {}", transport);
        return 1;
    }

    std::shared_ptr<client::CredentialProvider> credentials;
    if (!token_env.empty()) {
        credentials = std::make_shared<client::EnvironmentCredentialProvider>(token_env);
    } else {
        credentials = std::make_shared<client::StaticCredentialProvider>(token);
    }

    boost::asio::io_context io;
    client::AsioScheduler scheduler(io);

    network::TransportFactory factory;
    if (transport == "ws") {
        factory = network::make_websocket_factory(io, endpoint);
    } else if (transport == "sse") {
        factory = network::make_event_stream_factory(io, endpoint);
    }

    options.disconnect_on_terminal = true;
    client::ProgressClient progress_client(source_id, factory, credentials, scheduler, options);

    events::LoggerComponent logger(progress_client.bus());
    events::StreamStatsComponent stats(progress_client.bus());

    int exit_code = 1;

    progress_client.on_snapshot([&](const progress::ProgressSnapshot& s) {
        print_snapshot(s);
        if (s.phase == progress::Phase::Completed) {
            exit_code = 0;
            io.stop();
        } else if (s.phase == progress::Phase::Failed) {
            exit_code = 1;
            io.stop();
        }
    });

    progress_client.on_error([&](const ClientError& error) {
        if (error.is_terminal()) {
            std::cerr << "Giving up: " << error.message << std::endl;
            exit_code = 1;
            io.stop();
        }
    });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        spdlog::info("Interrupted, disconnecting");
        progress_client.disconnect();
        exit_code = 130;
        io.stop();
    });

    client::TimerHandle poll_timer;
    std::function<void()> poll_tick;

    if (transport == "poll") {
        progress_client.set_status_poller(
            std::make_shared<network::HttpStatusPoller>(io, endpoint, credentials));

        poll_tick = [&]() {
            progress_client.refresh();
            poll_timer = scheduler.schedule(std::chrono::seconds(poll_seconds), poll_tick);
        };
        spdlog::info("Polling {} every {}s", endpoint.status_url(source_id), poll_seconds);
        poll_tick();
    } else {
        spdlog::info("Following source {} over {}", source_id, transport);
        progress_client.connect();
    }

    io.run();

    poll_timer.cancel();
    progress_client.disconnect();
    stats.print_stats();

    return exit_code;
}
