#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace syncwatch::progress {

/**
 * @brief Lifecycle stage of a backend sync job
 *
 * Declared in the order the backend normally walks through them.
 * Completed and Failed are terminal. Retrying is reported by the backend
 * between crawl attempts and counts as active.
 */
enum class Phase {
    Initializing,
    Evaluating,
    DiscoveringDirectories,
    DiscoveringFiles,
    ProcessingFiles,
    SavingMetadata,
    Completed,
    Failed,
    Retrying
};

/// Wire name, e.g. "discovering_files"
const char* to_string(Phase phase) noexcept;

/// Inverse of to_string(); nullopt for anything the backend never sends
std::optional<Phase> parse_phase(std::string_view name) noexcept;

/// Fallback text for frames that omit phase_description
const char* default_description(Phase phase) noexcept;

[[nodiscard]] constexpr bool is_terminal(Phase phase) noexcept {
    return phase == Phase::Completed || phase == Phase::Failed;
}

[[nodiscard]] constexpr bool is_active(Phase phase) noexcept {
    return !is_terminal(phase);
}

/**
 * @brief Tracks the phase reported for one sync job
 *
 * The server owns phase sequencing, so observe() never rejects a
 * transition. It only records it and logs when the order looks wrong
 * (going backwards, or leaving a terminal phase).
 */
class PhaseTracker {
public:
    PhaseTracker() = default;

    /// Returns true when the phase differs from the previous one
    bool observe(Phase next);

    void reset() noexcept;

    [[nodiscard]] std::optional<Phase> current() const noexcept { return current_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return current_.has_value() && progress::is_terminal(*current_);
    }
    [[nodiscard]] std::size_t transitions() const noexcept { return transitions_; }
    [[nodiscard]] std::size_t out_of_order_transitions() const noexcept { return out_of_order_; }
    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool is_expected(Phase target) const;

    std::optional<Phase> current_;
    std::size_t transitions_ = 0;
    std::size_t out_of_order_ = 0;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace syncwatch::progress
