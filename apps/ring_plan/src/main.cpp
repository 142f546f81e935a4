// apps/ring_plan/src/main.cpp
// Swarm - ring_plan
// Purpose: print the ring every member would compute for a set of device
// names (successor, predecessor, opposite and distance to it). Handy to check
// what a ring strategy node will try to keep before deploying it.
//
// Usage:
//   ./ring_plan <name> <name> [name...]

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "swarm/topology/ring_math.hpp"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: ring_plan <name> <name> [name...]\n";
        return 1;
    }
    std::vector<std::string> names(argv + 1, argv + argc);

    const auto reference = swarm::topology::plan_ring(names, names.front());
    const auto n = reference.ring.size();
    std::cout << "ring of " << n << ":";
    for (const auto& m : reference.ring) std::cout << ' ' << m;
    std::cout << "\n----------------------------------------------------------\n";

    for (std::size_t i = 0; i < n; ++i) {
        const auto& self = reference.ring[i];
        const auto plan = swarm::topology::plan_ring(names, self);
        const auto opp_idx = swarm::topology::find_opposite(i, n);

        std::cout << std::left << std::setw(12) << self
                  << " succ=" << std::setw(12) << plan.successor.value_or("-")
                  << " pred=" << std::setw(12) << plan.predecessor.value_or("-")
                  << " opp="  << std::setw(12) << plan.opposite.value_or("-");
        if (opp_idx) std::cout << " (distance " << swarm::topology::ring_distance(i, *opp_idx, n) << ")";
        std::cout << '\n';
    }
    return 0;
}
