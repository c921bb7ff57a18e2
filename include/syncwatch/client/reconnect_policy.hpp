#pragma once

#include <chrono>
#include <cstdint>

namespace syncwatch::client {

/**
 * @brief Retry bound and exponential backoff for abnormal closes
 *
 * Attempt k (0-based) waits base_delay * 2^k: 1s, 2s, 4s, 8s, 16s with the
 * defaults. No jitter.
 */
struct ReconnectPolicy {
    std::uint32_t max_attempts = 5;
    std::chrono::milliseconds base_delay{1000};

    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt) const {
        // Cap the shift; attempts past 30 are far beyond any sane bound
        const std::uint32_t shift = attempt > 30 ? 30 : attempt;
        return base_delay * (std::int64_t{1} << shift);
    }
};

} // namespace syncwatch::client
