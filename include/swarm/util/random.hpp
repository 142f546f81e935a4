#pragma once
/**
 * @file random.hpp
 * @brief Injectable randomness for jitter, tie-breaking and churn decisions.
 * @details Components never own a global generator. Tests inject a seeded or
 *          scripted source so that probabilistic behavior is reproducible.
 */

#include <cstdint>
#include <mutex>
#include <random>

namespace swarm::util {

/** @class RandomSource
 *  @brief Thread-safe source of uniform values.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform integer in [0, n). Returns 0 when n == 0.
    virtual uint64_t next_below(uint64_t n) = 0;

    /// Uniform double in [0, 1).
    virtual double unit() = 0;
};

/** @class SeededRandom
 *  @brief mt19937_64-backed source; same seed, same sequence.
 */
class SeededRandom final : public RandomSource {
public:
    explicit SeededRandom(uint64_t seed = std::mt19937_64::default_seed) : gen_(seed) {}

    uint64_t next_below(uint64_t n) override;
    double unit() override;

private:
    std::mutex mu_;
    std::mt19937_64 gen_;
};

/// Seed drawn from std::random_device, for production wiring.
[[nodiscard]] uint64_t entropy_seed();

} // namespace swarm::util
