#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the topology engine.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in deployments and tests.
 */

#include <cstdint>

namespace swarm::config::constants {

// =====================
// Overlay capacity
// =====================
/// Hard ceiling of concurrently CONNECTED peers, shared by every strategy.
inline constexpr uint32_t MAX_CONNECTIONS = 4;

// =====================
// Base strategy
// Units: milliseconds
// =====================
inline constexpr uint32_t BASE_MANAGE_PERIOD_MS         = 5000;    ///< 5 s fill loop
inline constexpr uint32_t BASE_ROTATION_PERIOD_MS       = 300000;  ///< 5 min rotation loop
inline constexpr uint32_t BASE_ROTATION_JITTER_MAX_MS   = 60000;   ///< + up to 60 s
inline constexpr bool     BASE_ROTATION_ENABLED         = true;

// =====================
// Ring strategy
// =====================
inline constexpr uint32_t RING_STABILITY_DEBOUNCE_MS    = 60000;   ///< 1 min quiet window
inline constexpr uint32_t RING_REEVALUATE_PERIOD_MS     = 5000;    ///< re-check with no store change
inline constexpr uint32_t RING_BACKOFF_BASE_MS          = 2000;    ///< 2s, 4s, 8s, ...
inline constexpr uint32_t RING_BACKOFF_MAX_EXPONENT     = 6;       ///< caps at 64 s
inline constexpr uint32_t RING_BACKOFF_JITTER_MAX_MS    = 2000;
inline constexpr uint32_t RING_MIN_OPPOSITE_DISTANCE    = 3;       ///< distance <= 2 is "too close"
inline constexpr bool     RING_REDUCE_DISCOVERY_STABLE  = false;   ///< keep scanning once stable

// =====================
// Random ("cockroach") strategy
// =====================
inline constexpr uint32_t RANDOM_LOOP_PERIOD_MS         = 5000;
inline constexpr uint32_t RANDOM_LOOP_JITTER_MAX_MS     = 5000;
inline constexpr double   RANDOM_CHURN_PROBABILITY      = 0.1;     ///< ~1 churn event per minute
inline constexpr uint32_t RANDOM_BACKOFF_BASE_MS        = 1000;    ///< 2s, 4s, ... 32 s
inline constexpr uint32_t RANDOM_BACKOFF_MAX_EXPONENT   = 5;

// =====================
// Gossip / healing
// =====================
inline constexpr uint32_t GOSSIP_PERIOD_MS              = 30000;
inline constexpr uint32_t HEAL_DISCOVERY_WINDOW_MS      = 15000;
inline constexpr uint32_t HEAL_ADVERTISING_WINDOW_MS    = 300000;

// =====================
// Flood routing
// =====================
inline constexpr int32_t  FLOOD_DEFAULT_TTL             = 10;
inline constexpr uint32_t FLOOD_SEEN_TTL_MS             = 600000;  ///< 10 min dedup memory
inline constexpr const char* FLOOD_BROADCAST_DEST       = "BROADCAST";

// =====================
// Phase watchdog (0 disables the timeout for that phase)
// =====================
inline constexpr uint32_t WATCHDOG_SWEEP_PERIOD_MS      = 5000;
inline constexpr uint32_t WATCHDOG_DISCOVERED_MS        = 0;
inline constexpr uint32_t WATCHDOG_CONNECTING_MS        = 30000;
inline constexpr uint32_t WATCHDOG_CONNECTED_MS         = 0;
inline constexpr uint32_t WATCHDOG_DISCONNECTED_MS      = 30000;
inline constexpr uint32_t WATCHDOG_ERROR_MS             = 30000;

} // namespace swarm::config::constants
