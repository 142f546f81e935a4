// apps/mesh_sim/src/main.cpp
// Swarm - mesh_sim
// Purpose: run N nodes over the in-process simulated transport with
// accelerated timers and print the overlay they converge to.
//
// Usage:
//   ./mesh_sim [nodes] [strategy] [seconds] [config.json]
//     nodes     number of simulated devices (default 8)
//     strategy  base | ring | random (default ring)
//     seconds   how long to let the mesh settle (default 5)
//     config    optional JSON file applied over the accelerated defaults

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "swarm/config/config_loader.hpp"
#include "swarm/node/mesh_node.hpp"
#include "swarm/obs/log.hpp"
#include "swarm/state/network_graph.hpp"
#include "swarm/transport/sim_network.hpp"
#include "swarm/util/random.hpp"
#include "swarm/version.hpp"

namespace {

/// Timers scaled down so a demo converges in seconds instead of minutes.
swarm::config::MeshConfig accelerated(swarm::config::MeshConfig cfg) {
    cfg.strategies.base.manage_period_ms         = 100;
    cfg.strategies.base.rotation_period_ms       = 3000;
    cfg.strategies.base.rotation_jitter_max_ms   = 500;
    cfg.strategies.ring.stability_debounce_ms    = 1000;
    cfg.strategies.ring.reevaluate_period_ms     = 100;
    cfg.strategies.ring.backoff_base_ms          = 20;
    cfg.strategies.ring.backoff_jitter_max_ms    = 20;
    cfg.strategies.random.loop_period_ms         = 100;
    cfg.strategies.random.loop_jitter_max_ms     = 100;
    cfg.strategies.random.backoff_base_ms        = 10;
    cfg.gossip.period_ms                         = 200;
    cfg.healing.discovery_window_ms              = 500;
    cfg.healing.advertising_window_ms            = 1500;
    cfg.watchdog.sweep_period_ms                 = 100;
    cfg.watchdog.connecting_ms                   = 1000;
    cfg.watchdog.disconnected_ms                 = 500;
    cfg.watchdog.error_ms                        = 500;
    return cfg;
}

std::string device_name(int i) {
    std::ostringstream os;
    os << "node-" << std::setw(2) << std::setfill('0') << i;
    return os.str();
}

std::string join_names(const std::set<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    const int nodes          = (argc > 1) ? std::atoi(argv[1]) : 8;
    const std::string kind   = (argc > 2) ? argv[2] : "ring";
    const int seconds        = (argc > 3) ? std::atoi(argv[3]) : 5;

    auto base = accelerated(swarm::config::Loader::defaults());
    if (argc > 4) {
        auto loaded = swarm::config::Loader::load_from_file(argv[4]);
        if (!loaded) {
            std::cerr << "mesh_sim: cannot load " << argv[4] << ": "
                      << swarm::config::to_string(loaded.error()) << "\n";
            return EXIT_FAILURE;
        }
        base = *loaded;
    }
    const auto strategy = swarm::topology::strategy_from_string(kind);
    if (!strategy || nodes < 1 || seconds < 0) {
        std::cerr << "usage: mesh_sim [nodes] [base|ring|random] [seconds] [config.json]\n";
        return EXIT_FAILURE;
    }
    base.strategy = *strategy;
    if (!swarm::obs::set_level(base.log_level)) {
        std::cerr << "mesh_sim: unknown log level '" << base.log_level << "'\n";
    }

    std::cout << "swarm " << swarm::version_string << " - mesh_sim\n"
              << nodes << " nodes, " << kind << " strategy, " << seconds << " s\n"
              << "----------------------------------------------------------\n";

    auto net = swarm::transport::SimNetwork::create();
    std::vector<std::shared_ptr<swarm::transport::SimTransport>> transports;
    std::vector<std::shared_ptr<swarm::node::MeshNode>> mesh;
    for (int i = 0; i < nodes; ++i) {
        auto cfg = base;
        cfg.device_name = device_name(i);
        transports.push_back(net->attach(cfg.device_name));
        mesh.push_back(swarm::node::MeshNode::create(
            cfg, *transports.back(), std::make_shared<swarm::util::SeededRandom>(static_cast<uint64_t>(i) + 1)));
    }

    std::atomic<int> delivered{0};
    for (auto& n : mesh) {
        n->set_message_handler([&delivered](const swarm::wire::RoutedMessage&) { delivered.fetch_add(1); });
        n->start();
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));

    for (auto& n : mesh) {
        const auto snap = n->store().snapshot();
        std::cout << std::left << std::setw(9) << n->name()
                  << " links=" << snap->connected_count()
                  << " graph=" << snap->graph.size() << "v/" << swarm::state::edge_count(snap->graph) << "e"
                  << "  [" << join_names(net->links_of(n->name())) << "]\n";
    }
    std::cout << "total links: " << net->link_count() << "\n";

    if (!mesh.empty()) {
        mesh.front()->send_message(swarm::config::constants::FLOOD_BROADCAST_DEST, {'h', 'i'});
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        std::cout << "broadcast from " << mesh.front()->name() << " reached "
                  << delivered.load() << "/" << (nodes - 1) << " nodes\n";
    }

    for (auto& n : mesh) n->stop();
    std::cout << std::flush;
    return EXIT_SUCCESS;
}
