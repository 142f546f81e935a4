/**
 * @file device_state.hpp
 * @brief Peer identifiers, connection phases and the per-peer state record.
 *
 * Shared by the state store, the strategies and the node runtime. Keeping
 * the model in one header keeps phase comparisons consistent across modules.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace swarm::state {

/// Stable, human-sortable device identity. Orders the ring and keys the graph.
using DeviceName = std::string;

/// Ephemeral transport handle for one physical connection attempt.
using EndpointId = std::string;

/**
 * @brief Connection state machine of a remote peer.
 *
 * @note Typical flow:
 *  - Discovered -> Connecting -> Connected -> Disconnected
 *  - Connecting -> Error (request failure, rejection, watchdog)
 */
enum class ConnectionPhase : std::uint8_t {
  Discovered = 0,
  Connecting,
  Connected,
  Error,
  Disconnected
};

/// Short uppercase label for logs ("CONNECTED", ...).
std::string_view to_string(ConnectionPhase phase) noexcept;

/// True for the phases that occupy a connection slot.
inline bool is_busy(ConnectionPhase p) noexcept {
  return p == ConnectionPhase::Connected || p == ConnectionPhase::Connecting;
}

/**
 * @brief One entry per known peer endpoint.
 *
 * Value type; snapshots hand out copies. `retry_count` mirrors the per-name
 * counter held by the store at the time the snapshot was published.
 */
struct DeviceState final {
  /// Persistent name announced by the peer.
  DeviceName name;

  /// Transport handle the peer is reachable at.
  EndpointId endpoint;

  /// Current phase.
  ConnectionPhase phase{ConnectionPhase::Discovered};

  /// Failed attempts since the last successful connection.
  int retry_count{0};

  /// Last phase change (steady clock). Drives the watchdog.
  std::chrono::steady_clock::time_point last_seen_at{};

  bool operator==(const DeviceState&) const = default;
};

} // namespace swarm::state
