#pragma once
/**
 * @file ring_math.hpp
 * @brief Pure ring geometry: distances, neighbors, opposite, spare pruning.
 * @details Members are ordered lexicographically by device name; every node
 *          computes the same ring from the same member set.
 */

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "swarm/config/constants.hpp"
#include "swarm/state/device_state.hpp"

namespace swarm::topology {

using state::DeviceName;

/// Shortest hop count between positions @p a and @p b on a ring of @p n. Requires a, b < n.
[[nodiscard]] std::size_t ring_distance(std::size_t a, std::size_t b, std::size_t n) noexcept;

/**
 * @brief Index of the node "across" from @p i.
 * @details Starts at i + n/2 and walks forward past nodes closer than
 *          @p min_distance. Rings of 3 or fewer never have one.
 * @return std::nullopt if no node is far enough.
 */
[[nodiscard]] std::optional<std::size_t>
find_opposite(std::size_t i, std::size_t n,
              std::size_t min_distance = config::constants::RING_MIN_OPPOSITE_DISTANCE) noexcept;

/** @struct RingPlan
 *  @brief Where the local node sits and whom it must keep.
 */
struct RingPlan {
    std::vector<DeviceName> ring;          ///< sorted, distinct members (self included)
    std::size_t my_index{0};
    std::optional<DeviceName> successor;
    std::optional<DeviceName> predecessor;
    std::optional<DeviceName> opposite;

    /// False when fewer than two members are known or self has no place (nothing to do).
    [[nodiscard]] bool valid() const noexcept { return ring.size() >= 2 && my_index < ring.size(); }

    /// {successor, predecessor, opposite}, distinct.
    [[nodiscard]] std::set<DeviceName> important() const;

    /// Names the local node dials itself: successor and opposite.
    [[nodiscard]] std::set<DeviceName> dial_targets() const;

    [[nodiscard]] bool is_immediate_neighbor(const DeviceName& n) const {
        return (successor && *successor == n) || (predecessor && *predecessor == n);
    }
};

/// Build the ring over @p names plus @p self (duplicates ignored).
[[nodiscard]] RingPlan plan_ring(std::vector<DeviceName> names, const DeviceName& self,
                                 std::size_t min_opposite_distance = config::constants::RING_MIN_OPPOSITE_DISTANCE);

/**
 * @brief Connected spares to drop.
 * @param plan Current ring plan.
 * @param connected Names currently CONNECTED.
 * @param busy Names CONNECTED or CONNECTING.
 * @param max_connections Capacity.
 * @details spares = connected minus important; missing = important members
 *          that are not busy; allowed = max - |important connected| - missing.
 *          Drops the first (spares - allowed) spares in ring order when over.
 */
[[nodiscard]] std::vector<DeviceName> select_prunes(const RingPlan& plan,
                                                    const std::set<DeviceName>& connected,
                                                    const std::set<DeviceName>& busy,
                                                    std::size_t max_connections);

/// True when successor, predecessor and (if any) opposite are all connected and at least two links exist.
[[nodiscard]] bool is_ring_stable(const RingPlan& plan, const std::set<DeviceName>& connected);

} // namespace swarm::topology
