#pragma once
/**
 * @file flood_router.hpp
 * @brief Best-effort flooding of RoutedMessage with duplicate suppression.
 *
 * Rules for an incoming message:
 *  - ttl <= 0: dropped before anything else.
 *  - (message_id, source_id, dest_id) already seen: dropped as duplicate.
 *  - addressed to us: delivered, not forwarded.
 *  - broadcast: delivered and forwarded with ttl-1 while that stays > 0.
 *  - addressed elsewhere: forwarded with ttl-1 while that stays > 0.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "swarm/config/constants.hpp"
#include "swarm/state/device_state.hpp"
#include "swarm/util/random.hpp"
#include "swarm/wire/routed_message.hpp"

namespace swarm::routing {

/** @struct FloodConfig
 *  @brief Hop limit and dedup memory.
 */
struct FloodConfig {
    int32_t  default_ttl{config::constants::FLOOD_DEFAULT_TTL};
    uint32_t seen_ttl_ms{config::constants::FLOOD_SEEN_TTL_MS};
};

/// Why an incoming message was (or was not) processed.
enum class FloodVerdict : uint8_t { Accepted, Duplicate, Expired };

/** @struct FloodDecision
 *  @brief What the node should do with one incoming message.
 */
struct FloodDecision {
    FloodVerdict verdict{FloodVerdict::Accepted};
    bool deliver{false};                          ///< hand to the local application
    std::optional<wire::RoutedMessage> forward;   ///< copy to rebroadcast (ttl already decremented)
};

class FloodRouter final {
public:
    using Clock = std::chrono::steady_clock;

    FloodRouter(state::DeviceName self, util::RandomSource& rng, FloodConfig cfg = {})
        : self_(std::move(self)), rng_(rng), cfg_(cfg) {}

    /**
     * @brief New message originating here; already marked seen so echoes are dropped.
     * @param dest Device name or BROADCAST.
     */
    wire::RoutedMessage make_message(const state::DeviceName& dest, wire::Bytes payload,
                                     Clock::time_point now = Clock::now());

    /// Apply the flooding rules to a received message.
    FloodDecision handle_incoming(const wire::RoutedMessage& msg, Clock::time_point now = Clock::now());

    /// Forget seen entries older than seen_ttl. Returns how many were removed.
    std::size_t sweep(Clock::time_point now = Clock::now());

    [[nodiscard]] std::size_t seen_count() const;

    /// Fresh 128-bit identifier as 32 lowercase hex digits.
    [[nodiscard]] std::string next_message_id();

private:
    state::DeviceName self_;
    util::RandomSource& rng_;
    FloodConfig cfg_;

    mutable std::mutex mu_;
    std::unordered_map<wire::MessageKey, Clock::time_point, wire::MessageKeyHash> seen_;
};

} // namespace swarm::routing
