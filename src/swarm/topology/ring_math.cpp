/**
 * @file ring_math.cpp
 * @brief Ring geometry helpers.
 */
#include "swarm/topology/ring_math.hpp"

#include <algorithm>

namespace swarm::topology {

std::size_t ring_distance(std::size_t a, std::size_t b, std::size_t n) noexcept {
    if (n == 0) return 0;
    const std::size_t d = a > b ? a - b : b - a;
    return std::min(d, n - d);
}

std::optional<std::size_t> find_opposite(std::size_t i, std::size_t n, std::size_t min_distance) noexcept {
    if (n <= 3 || i >= n) return std::nullopt;
    std::size_t cur = (i + n / 2) % n;
    while (ring_distance(cur, i, n) < min_distance) {
        cur = (cur + 1) % n;
        if (cur == i) return std::nullopt;
    }
    return cur;
}

std::set<DeviceName> RingPlan::important() const {
    std::set<DeviceName> out;
    if (successor) out.insert(*successor);
    if (predecessor) out.insert(*predecessor);
    if (opposite) out.insert(*opposite);
    return out;
}

std::set<DeviceName> RingPlan::dial_targets() const {
    std::set<DeviceName> out;
    if (successor) out.insert(*successor);
    if (opposite) out.insert(*opposite);
    return out;
}

RingPlan plan_ring(std::vector<DeviceName> names, const DeviceName& self, std::size_t min_opposite_distance) {
    names.push_back(self);
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    names.erase(std::remove(names.begin(), names.end(), DeviceName{}), names.end());

    RingPlan plan;
    plan.ring = std::move(names);
    const auto it = std::find(plan.ring.begin(), plan.ring.end(), self);
    plan.my_index = static_cast<std::size_t>(it - plan.ring.begin());
    if (!plan.valid()) return plan;

    const std::size_t n = plan.ring.size();
    const std::size_t i = plan.my_index;
    plan.successor   = plan.ring[(i + 1) % n];
    plan.predecessor = plan.ring[(i + n - 1) % n];
    if (auto opp = find_opposite(i, n, min_opposite_distance)) plan.opposite = plan.ring[*opp];
    return plan;
}

std::vector<DeviceName> select_prunes(const RingPlan& plan,
                                      const std::set<DeviceName>& connected,
                                      const std::set<DeviceName>& busy,
                                      std::size_t max_connections) {
    if (!plan.valid()) return {};
    const auto important = plan.important();

    std::vector<DeviceName> spares;
    for (const auto& name : plan.ring) {   // ring order keeps the choice deterministic
        if (connected.contains(name) && !important.contains(name)) spares.push_back(name);
    }
    // Connected names not on the ring (should not happen, but never keep them silently).
    for (const auto& name : connected) {
        if (!important.contains(name) &&
            std::find(plan.ring.begin(), plan.ring.end(), name) == plan.ring.end()) {
            spares.push_back(name);
        }
    }

    std::size_t important_up = 0;
    std::size_t missing = 0;
    for (const auto& name : important) {
        if (connected.contains(name)) ++important_up;
        if (!busy.contains(name)) ++missing;
    }
    const auto allowed = static_cast<long long>(max_connections) -
                         static_cast<long long>(important_up) - static_cast<long long>(missing);
    const auto keep = static_cast<std::size_t>(std::max(allowed, 0LL));
    if (spares.size() <= keep) return {};
    spares.resize(spares.size() - keep);
    return spares;
}

bool is_ring_stable(const RingPlan& plan, const std::set<DeviceName>& connected) {
    if (!plan.valid() || !plan.successor || !plan.predecessor) return false;
    if (!connected.contains(*plan.successor) || !connected.contains(*plan.predecessor)) return false;
    if (plan.opposite && !connected.contains(*plan.opposite)) return false;
    return connected.size() >= 2;
}

} // namespace swarm::topology
