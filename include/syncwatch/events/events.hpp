/**
 * @file events.hpp
 * @brief Events published on a ProgressClient's bus
 *
 * NAMING CONVENTION:
 * Events are past-tense: SnapshotReceivedEvent, ConnectionStateChangedEvent
 *
 * Every event names the source it belongs to, so one set of components
 * can listen to several clients.
 */

#pragma once

#include "syncwatch/client/connection_state.hpp"
#include "syncwatch/core/error.hpp"
#include "syncwatch/progress/snapshot.hpp"

#include <cstdint>
#include <string>

namespace syncwatch::events {

/**
 * @brief A progress frame (streamed or polled) produced a new snapshot
 *
 * WHO SUBSCRIBES:
 * - UI panel (progress bar, phase label)
 * - LoggerComponent, StreamStatsComponent
 */
struct SnapshotReceivedEvent {
    progress::ProgressSnapshot snapshot;
};

struct ConnectionStateChangedEvent {
    std::string source_id;
    client::ConnectionState previous;
    client::ConnectionState current;
};

/// Liveness only; never accompanies or replaces a snapshot
struct HeartbeatReceivedEvent {
    std::string source_id;
    bool is_active = false;
    std::int64_t timestamp = 0;
};

/**
 * @brief Any failure surfaced to the UI
 *
 * error.is_terminal() tells the UI to stop showing "reconnecting" and
 * offer a manual retry instead.
 */
struct ClientErrorEvent {
    std::string source_id;
    ClientError error;
};

} // namespace syncwatch::events
