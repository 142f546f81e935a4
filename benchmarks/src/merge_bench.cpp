/**
 * @file merge_bench.cpp
 * @brief Microbenchmark for gossip graph handling.
 *
 * Measures, for rings of increasing size with chords:
 *   1) merge_into() of a peer's full view into a half-known local view,
 *   2) a no-op re-merge (idempotent case, the common steady state),
 *   3) CBOR encode + decode of a TOPOLOGY_GOSSIP body.
 *
 * Reports: ns per operation.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "swarm/state/network_graph.hpp"
#include "swarm/wire/frame.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;
using swarm::state::NetworkGraph;

struct Result {
  std::string name;          // e.g., "merge@64"
  std::size_t iters = 0;     // repetitions
  double      ns_per_op = 0.0;
};

// Ring of n vertices, each also linked to the node halfway round.
NetworkGraph make_ring(std::size_t n) {
  NetworkGraph g;
  for (std::size_t i = 0; i < n; ++i) {
    const auto self = "dev-" + std::to_string(i);
    auto& row = g[self];
    row.insert("dev-" + std::to_string((i + 1) % n));
    row.insert("dev-" + std::to_string((i + n - 1) % n));
    row.insert("dev-" + std::to_string((i + n / 2) % n));
  }
  return g;
}

// Keep every other row: what a node knows before convergence.
NetworkGraph half_of(const NetworkGraph& g) {
  NetworkGraph out;
  bool keep = true;
  for (const auto& [k, v] : g) {
    if (keep) out.emplace(k, v);
    keep = !keep;
  }
  return out;
}

template <class Fn>
Result time_it(std::string name, std::size_t iters, Fn&& fn) {
  const auto t0 = clock::now();
  for (std::size_t i = 0; i < iters; ++i) fn();
  const auto t1 = clock::now();
  Result r;
  r.name = std::move(name);
  r.iters = iters;
  r.ns_per_op = static_cast<double>(std::chrono::duration_cast<ns>(t1 - t0).count()) / static_cast<double>(iters);
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(1)
            << std::left << std::setw(18) << r.name
            << "  iters=" << std::setw(8) << r.iters
            << "  ns/op=" << r.ns_per_op << '\n';
}

} // namespace bench

int main() {
  using namespace bench;

  const std::vector<std::size_t> sizes = {8, 64, 256};
  std::size_t sink = 0; // keeps results observable

  std::cout << "Gossip graph microbenchmark\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto n : sizes) {
    const auto full = make_ring(n);
    const auto half = half_of(full);
    const std::size_t iters = n <= 64 ? 20'000 : 2'000;

    print(time_it("merge@" + std::to_string(n), iters, [&] {
      auto local = half;
      sink += swarm::state::merge_into(local, full) ? 1 : 0;
    }));

    auto converged = full;
    print(time_it("remerge@" + std::to_string(n), iters, [&] {
      sink += swarm::state::merge_into(converged, full) ? 1 : 0;
    }));

    print(time_it("cbor@" + std::to_string(n), iters / 4, [&] {
      const auto bytes = swarm::wire::encode_gossip(full);
      const auto back = swarm::wire::decode_gossip(bytes);
      sink += back ? back->size() : 0;
    }));
  }

  std::cout << "(checksum " << sink << ")\n" << std::flush;
  return 0;
}
