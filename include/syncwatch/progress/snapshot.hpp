#pragma once

#include "syncwatch/progress/phase.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace syncwatch::progress {

/**
 * @brief One point-in-time status report for a sync job
 *
 * A new snapshot is built for every progress frame and replaces the
 * previous one; nothing keeps a history. Activity is derived from the
 * phase, so a snapshot can never disagree with its own phase.
 */
struct ProgressSnapshot {
    std::string source_id;
    Phase phase = Phase::Initializing;
    std::string phase_description;   ///< Display only
    std::uint64_t elapsed_seconds = 0;

    std::uint64_t directories_found = 0;
    std::uint64_t directories_processed = 0;
    std::uint64_t files_found = 0;
    std::uint64_t files_processed = 0;
    std::uint64_t bytes_processed = 0;

    double processing_rate_files_per_sec = 0.0;
    double files_progress_percent = 0.0;                     ///< [0, 100]
    std::optional<std::uint64_t> estimated_seconds_remaining;

    std::optional<std::string> current_directory;
    std::optional<std::string> current_file;                 ///< Absent once processing finishes

    std::uint64_t errors = 0;
    std::uint64_t warnings = 0;

    [[nodiscard]] bool is_active() const noexcept { return progress::is_active(phase); }
    [[nodiscard]] bool is_terminal() const noexcept { return progress::is_terminal(phase); }

    bool operator==(const ProgressSnapshot& other) const {
        return source_id == other.source_id &&
               phase == other.phase &&
               phase_description == other.phase_description &&
               elapsed_seconds == other.elapsed_seconds &&
               directories_found == other.directories_found &&
               directories_processed == other.directories_processed &&
               files_found == other.files_found &&
               files_processed == other.files_processed &&
               bytes_processed == other.bytes_processed &&
               processing_rate_files_per_sec == other.processing_rate_files_per_sec &&
               files_progress_percent == other.files_progress_percent &&
               estimated_seconds_remaining == other.estimated_seconds_remaining &&
               current_directory == other.current_directory &&
               current_file == other.current_file &&
               errors == other.errors &&
               warnings == other.warnings;
    }

    bool operator!=(const ProgressSnapshot& other) const { return !(*this == other); }
};

} // namespace syncwatch::progress
