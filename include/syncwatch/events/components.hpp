/**
 * @file components.hpp
 * @brief Ready-made subscribers for a client's event bus
 *
 * EXAMPLE:
 * ProgressClient client(...);
 * LoggerComponent logger(client.bus());
 * StreamStatsComponent stats(client.bus());
 */

#pragma once

#include "syncwatch/events/event_bus.hpp"
#include "syncwatch/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace syncwatch::events {

/**
 * @brief Logs every snapshot, state change, heartbeat and error
 *
 * Unsubscribes on destruction, so it may be shorter-lived than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        snapshot_id_ = bus_.subscribe<SnapshotReceivedEvent>([this](const SnapshotReceivedEvent& e) {
            on_snapshot(e);
        });

        state_id_ = bus_.subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
            on_state_changed(e);
        });

        heartbeat_id_ = bus_.subscribe<HeartbeatReceivedEvent>([this](const HeartbeatReceivedEvent& e) {
            on_heartbeat(e);
        });

        error_id_ = bus_.subscribe<ClientErrorEvent>([this](const ClientErrorEvent& e) {
            on_error(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<SnapshotReceivedEvent>(snapshot_id_);
        bus_.unsubscribe<ConnectionStateChangedEvent>(state_id_);
        bus_.unsubscribe<HeartbeatReceivedEvent>(heartbeat_id_);
        bus_.unsubscribe<ClientErrorEvent>(error_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_snapshot(const SnapshotReceivedEvent& e) {
        const auto& s = e.snapshot;
        spdlog::info("[Snapshot] source={} phase={} files={}/{} dirs={}/{} percent={:.1f} active={}",
            s.source_id,
            progress::to_string(s.phase),
            s.files_processed,
            s.files_found,
            s.directories_processed,
            s.directories_found,
            s.files_progress_percent,
            s.is_active());
    }

    void on_state_changed(const ConnectionStateChangedEvent& e) {
        spdlog::info("[ConnectionState] source={} {} -> {}",
            e.source_id, client::to_string(e.previous), client::to_string(e.current));
    }

    void on_heartbeat(const HeartbeatReceivedEvent& e) {
        spdlog::debug("[Heartbeat] source={} active={} timestamp={}", e.source_id, e.is_active, e.timestamp);
    }

    void on_error(const ClientErrorEvent& e) {
        if (e.error.is_terminal()) {
            spdlog::error("[Error] source={} kind={} message={}",
                          e.source_id, to_string(e.error.kind), e.error.message);
        } else {
            spdlog::warn("[Error] source={} kind={} message={}",
                         e.source_id, to_string(e.error.kind), e.error.message);
        }
    }

    EventBus& bus_;
    SubscriptionId snapshot_id_ = 0;
    SubscriptionId state_id_ = 0;
    SubscriptionId heartbeat_id_ = 0;
    SubscriptionId error_id_ = 0;
};

/**
 * @brief Counts stream traffic for one or more clients
 *
 * USAGE:
 * StreamStatsComponent stats(client.bus());
 * // Later...
 * stats.print_stats();
 */
class StreamStatsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> snapshots{0};
        std::atomic<std::uint64_t> heartbeats{0};
        std::atomic<std::uint64_t> connects{0};
        std::atomic<std::uint64_t> disconnects{0};
        std::atomic<std::uint64_t> decode_errors{0};
        std::atomic<std::uint64_t> server_errors{0};
        std::atomic<std::uint64_t> transport_errors{0};
        std::atomic<std::uint64_t> terminal_errors{0};
    };

    explicit StreamStatsComponent(EventBus& bus) : bus_(bus) {
        snapshot_id_ = bus_.subscribe<SnapshotReceivedEvent>([this](const SnapshotReceivedEvent&) {
            stats_.snapshots++;
        });

        heartbeat_id_ = bus_.subscribe<HeartbeatReceivedEvent>([this](const HeartbeatReceivedEvent&) {
            stats_.heartbeats++;
        });

        state_id_ = bus_.subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
            on_state_changed(e);
        });

        error_id_ = bus_.subscribe<ClientErrorEvent>([this](const ClientErrorEvent& e) {
            on_error(e);
        });
    }

    ~StreamStatsComponent() {
        bus_.unsubscribe<SnapshotReceivedEvent>(snapshot_id_);
        bus_.unsubscribe<HeartbeatReceivedEvent>(heartbeat_id_);
        bus_.unsubscribe<ConnectionStateChangedEvent>(state_id_);
        bus_.unsubscribe<ClientErrorEvent>(error_id_);
    }

    StreamStatsComponent(const StreamStatsComponent&) = delete;
    StreamStatsComponent& operator=(const StreamStatsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Stream Statistics:");
        spdlog::info("  Snapshots:        {}", stats_.snapshots.load());
        spdlog::info("  Heartbeats:       {}", stats_.heartbeats.load());
        spdlog::info("  Connects:         {}", stats_.connects.load());
        spdlog::info("  Disconnects:      {}", stats_.disconnects.load());
        spdlog::info("  Decode errors:    {}", stats_.decode_errors.load());
        spdlog::info("  Server errors:    {}", stats_.server_errors.load());
        spdlog::info("  Transport errors: {}", stats_.transport_errors.load());
        spdlog::info("  Terminal errors:  {}", stats_.terminal_errors.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_state_changed(const ConnectionStateChangedEvent& e) {
        if (e.current == client::ConnectionState::Connected) {
            stats_.connects++;
        } else if (e.previous == client::ConnectionState::Connected &&
                   e.current == client::ConnectionState::Disconnected) {
            stats_.disconnects++;
        }
    }

    void on_error(const ClientErrorEvent& e) {
        switch (e.error.kind) {
            case ErrorKind::Decode:
                stats_.decode_errors++;
                break;
            case ErrorKind::Server:
                stats_.server_errors++;
                break;
            case ErrorKind::Transport:
                stats_.transport_errors++;
                break;
            case ErrorKind::Authentication:
            case ErrorKind::ReconnectExhausted:
                stats_.terminal_errors++;
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
    SubscriptionId snapshot_id_ = 0;
    SubscriptionId heartbeat_id_ = 0;
    SubscriptionId state_id_ = 0;
    SubscriptionId error_id_ = 0;
};

} // namespace syncwatch::events
