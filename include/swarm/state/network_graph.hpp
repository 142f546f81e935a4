#pragma once
/**
 * @file network_graph.hpp
 * @brief Gossiped adjacency view of the overlay and its join operation.
 * @details The graph is eventually consistent: it is never authoritative for any
 *          peer at any instant, and merges only ever add vertices or edges.
 */

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "swarm/state/device_state.hpp"

namespace swarm::state {

/// Neighbor set of one device. Ordered so snapshots compare and log stably.
using NeighborSet = std::set<DeviceName>;

/// DeviceName -> names it is believed to be directly connected to.
using NetworkGraph = std::map<DeviceName, NeighborSet>;

/**
 * @brief Union-merge @p remote into @p local (per-key set union).
 *
 * Commutative, idempotent and monotonic (a CRDT join).
 * @param local Graph updated in place.
 * @param remote Graph received from a peer.
 * @param skip Key left untouched (the local node's own row); empty = none.
 * @return true if @p local gained at least one vertex or edge.
 */
bool merge_into(NetworkGraph& local, const NetworkGraph& remote, const DeviceName& skip = {});

/// Pure form of merge_into: returns local ∪ remote.
[[nodiscard]] NetworkGraph merged(NetworkGraph local, const NetworkGraph& remote);

/// Neighbors of @p name, empty if it is not a vertex.
[[nodiscard]] std::vector<DeviceName> neighbors_of(const NetworkGraph& g, const DeviceName& name);

/// Out-degree of @p name (0 if it is not a vertex).
[[nodiscard]] std::size_t degree(const NetworkGraph& g, const DeviceName& name) noexcept;

/// True if @p name appears as a key or inside any neighbor set.
[[nodiscard]] bool has_vertex(const NetworkGraph& g, const DeviceName& name) noexcept;

/// True if @p b is listed as a neighbor of @p a.
[[nodiscard]] bool has_edge(const NetworkGraph& g, const DeviceName& a, const DeviceName& b) noexcept;

/// Total number of directed edges.
[[nodiscard]] std::size_t edge_count(const NetworkGraph& g) noexcept;

} // namespace swarm::state
