/**
 * @file network_graph.cpp
 * @brief Graph join and read helpers.
 */
#include "swarm/state/network_graph.hpp"

#include <algorithm>

namespace swarm::state {

bool merge_into(NetworkGraph& local, const NetworkGraph& remote, const DeviceName& skip) {
    bool changed = false;
    for (const auto& [name, neighbors] : remote) {
        if (!skip.empty() && name == skip) continue;
        auto [it, inserted] = local.try_emplace(name);
        changed = changed || inserted;
        auto& mine = it->second;
        if (std::includes(mine.begin(), mine.end(), neighbors.begin(), neighbors.end())) continue;
        mine.insert(neighbors.begin(), neighbors.end());
        changed = true;
    }
    return changed;
}

NetworkGraph merged(NetworkGraph local, const NetworkGraph& remote) {
    merge_into(local, remote);
    return local;
}

std::vector<DeviceName> neighbors_of(const NetworkGraph& g, const DeviceName& name) {
    const auto it = g.find(name);
    if (it == g.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::size_t degree(const NetworkGraph& g, const DeviceName& name) noexcept {
    const auto it = g.find(name);
    return it == g.end() ? 0 : it->second.size();
}

bool has_vertex(const NetworkGraph& g, const DeviceName& name) noexcept {
    if (g.contains(name)) return true;
    return std::any_of(g.begin(), g.end(),
                       [&](const auto& kv) { return kv.second.contains(name); });
}

bool has_edge(const NetworkGraph& g, const DeviceName& a, const DeviceName& b) noexcept {
    const auto it = g.find(a);
    return it != g.end() && it->second.contains(b);
}

std::size_t edge_count(const NetworkGraph& g) noexcept {
    std::size_t n = 0;
    for (const auto& kv : g) n += kv.second.size();
    return n;
}

} // namespace swarm::state
