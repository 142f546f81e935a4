#pragma once
/**
 * @file backoff.hpp
 * @brief Capped exponential retry delay.
 *
 * delay(r) = base_ms * 2^(min(r, max_exponent) + exponent_shift) + jitter, for r > 0.
 * No delay for the first attempt (r == 0).
 */

#include <algorithm>
#include <chrono>
#include <cstdint>

#include "swarm/util/random.hpp"

namespace swarm::topology {

struct BackoffPolicy {
    uint32_t base_ms{1000};
    uint32_t max_exponent{5};
    int      exponent_shift{0};  ///< -1 makes the first retry wait exactly base_ms
    uint32_t jitter_max_ms{0};   ///< uniform extra in [0, jitter_max_ms]

    /// Deterministic part of the delay.
    [[nodiscard]] std::chrono::milliseconds base_delay(int retry) const noexcept {
        if (retry <= 0) return std::chrono::milliseconds{0};
        const int exp = std::max(0, std::min(retry, static_cast<int>(max_exponent)) + exponent_shift);
        return std::chrono::milliseconds{static_cast<int64_t>(base_ms) << exp};
    }

    /// Full delay including jitter.
    [[nodiscard]] std::chrono::milliseconds delay(int retry, util::RandomSource& rng) const {
        auto d = base_delay(retry);
        if (retry > 0 && jitter_max_ms > 0) {
            d += std::chrono::milliseconds{static_cast<int64_t>(rng.next_below(uint64_t{jitter_max_ms} + 1))};
        }
        return d;
    }
};

} // namespace swarm::topology
