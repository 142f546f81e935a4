/**
 * @file random.cpp
 * @brief SeededRandom implementation.
 */
#include "swarm/util/random.hpp"

namespace swarm::util {

uint64_t SeededRandom::next_below(uint64_t n) {
    if (n == 0) return 0;
    std::lock_guard<std::mutex> lk(mu_);
    return gen_() % n;
}

double SeededRandom::unit() {
    std::lock_guard<std::mutex> lk(mu_);
    // 53 high bits -> [0, 1) with full double precision.
    return static_cast<double>(gen_() >> 11) * 0x1.0p-53;
}

uint64_t entropy_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace swarm::util
