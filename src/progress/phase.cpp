#include "syncwatch/progress/phase.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>
#include <vector>

namespace syncwatch::progress {
namespace {

constexpr std::array<std::pair<Phase, const char*>, 9> kPhaseNames {{
    {Phase::Initializing, "initializing"},
    {Phase::Evaluating, "evaluating"},
    {Phase::DiscoveringDirectories, "discovering_directories"},
    {Phase::DiscoveringFiles, "discovering_files"},
    {Phase::ProcessingFiles, "processing_files"},
    {Phase::SavingMetadata, "saving_metadata"},
    {Phase::Completed, "completed"},
    {Phase::Failed, "failed"},
    {Phase::Retrying, "retrying"},
}};

bool is_forward(Phase current, Phase target) {
    static const std::unordered_map<Phase, std::vector<Phase>> forward {
        {Phase::Initializing, {Phase::Evaluating, Phase::DiscoveringDirectories, Phase::DiscoveringFiles}},
        {Phase::Evaluating, {Phase::DiscoveringDirectories, Phase::DiscoveringFiles, Phase::ProcessingFiles}},
        {Phase::DiscoveringDirectories, {Phase::DiscoveringFiles, Phase::ProcessingFiles}},
        {Phase::DiscoveringFiles, {Phase::ProcessingFiles, Phase::SavingMetadata}},
        {Phase::ProcessingFiles, {Phase::SavingMetadata, Phase::Completed}},
        {Phase::SavingMetadata, {Phase::Completed}},
    };

    // Failure and retry can interrupt any running phase; a retry resumes anywhere
    if (target == Phase::Failed || target == Phase::Retrying || current == Phase::Retrying) {
        return true;
    }

    const auto it = forward.find(current);
    if (it == forward.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(Phase phase) noexcept {
    for (const auto& [value, name] : kPhaseNames) {
        if (value == phase) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Phase> parse_phase(std::string_view name) noexcept {
    for (const auto& [value, wire_name] : kPhaseNames) {
        if (name == wire_name) {
            return value;
        }
    }
    return std::nullopt;
}

const char* default_description(Phase phase) noexcept {
    switch (phase) {
        case Phase::Initializing: return "Initializing sync operation";
        case Phase::Evaluating: return "Evaluating what needs to be synced";
        case Phase::DiscoveringDirectories: return "Discovering directories and folder structure";
        case Phase::DiscoveringFiles: return "Discovering files to sync";
        case Phase::ProcessingFiles: return "Downloading and processing files";
        case Phase::SavingMetadata: return "Saving metadata and finalizing sync";
        case Phase::Completed: return "Sync completed successfully";
        case Phase::Failed: return "Sync failed";
        case Phase::Retrying: return "Retrying after a transient failure";
    }
    return "";
}

bool PhaseTracker::observe(Phase next) {
    if (current_ == next) {
        return false;
    }

    if (current_.has_value() && !is_expected(next)) {
        ++out_of_order_;
        spdlog::warn("Unexpected phase transition {} -> {} (accepted)",
                     to_string(*current_), to_string(next));
    }

    current_ = next;
    ++transitions_;
    last_transition_ = std::chrono::steady_clock::now();
    return true;
}

void PhaseTracker::reset() noexcept {
    current_.reset();
    transitions_ = 0;
    out_of_order_ = 0;
    last_transition_ = {};
}

bool PhaseTracker::is_expected(Phase target) const {
    if (!current_.has_value()) {
        return true;
    }
    if (progress::is_terminal(*current_)) {
        return false;
    }
    return is_forward(*current_, target);
}

} // namespace syncwatch::progress
