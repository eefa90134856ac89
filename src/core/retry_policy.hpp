#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>

namespace tidemark {

/**
 * RetryPolicy - Exponential backoff with bounded jitter.
 *
 * After the n-th failed attempt (n >= 1) the item waits
 *   min(max_delay, base_delay * multiplier^(n-1))
 * scaled by a factor in [1 - jitter, 1 + jitter], again capped at max_delay.
 * Once attempt_count reaches max_attempts the item is dead-lettered.
 *
 * Jitter is derived from (sequence, attempt, seed) rather than a shared RNG,
 * so the same item always gets the same schedule.
 */
struct RetryPolicy {
    std::chrono::milliseconds base_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{60'000};
    int max_attempts = 8;
    double jitter = 0.2;
    uint64_t seed = 0x7469'6465'6d61'726bULL;

    /**
     * Delay before the next attempt once `attempt` attempts have failed.
     */
    [[nodiscard]] std::chrono::milliseconds delay_for(int64_t sequence, int attempt) const;

    /**
     * Delay without jitter; the midpoint of the jitter window.
     */
    [[nodiscard]] std::chrono::milliseconds nominal_delay(int attempt) const;

    [[nodiscard]] Timestamp next_attempt_at(Timestamp now, int64_t sequence, int attempt) const {
        return now + delay_for(sequence, attempt);
    }

    [[nodiscard]] bool exhausted(int attempt_count) const noexcept {
        return attempt_count >= max_attempts;
    }

    [[nodiscard]] bool valid() const noexcept {
        return base_delay.count() >= 0 && multiplier >= 1.0 &&
               max_delay >= base_delay && max_attempts >= 1 &&
               jitter >= 0.0 && jitter < 1.0;
    }
};

} // namespace tidemark
