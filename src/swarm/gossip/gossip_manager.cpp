/**
 * @file gossip_manager.cpp
 * @brief Gossip broadcast loop and merge.
 */
#include "swarm/gossip/gossip_manager.hpp"

#include <chrono>
#include <string>

#include "swarm/obs/log.hpp"

namespace swarm::gossip {

void GossipManager::start() {
    tasks_.reopen();
    tasks_.spawn([this](std::stop_token st) {
        while (sched::TaskGroup::sleep_for(st, std::chrono::milliseconds{cfg_.period_ms})) {
            (void)broadcast_now();
        }
    });
}

void GossipManager::stop() { tasks_.stop(); }

bool GossipManager::broadcast_now() {
    const auto snap = store_.snapshot();
    if (snap->graph.empty()) return false;
    transport_.broadcast(wire::gossip_frame(snap->graph));
    rounds_.fetch_add(1, std::memory_order_relaxed);
    observer_.record({obs::EventKind::GossipSent, {}, std::to_string(snap->graph.size()) + " vertices"});
    return true;
}

swarm_detail::expected<bool, wire::CodecError> GossipManager::on_gossip(std::span<const uint8_t> body) {
    auto remote = wire::decode_gossip(body);
    if (!remote) {
        obs::logger()->warn("[{}] gossip: dropping undecodable graph ({})",
                            store_.self(), wire::to_string(remote.error()));
        return swarm_detail::unexpected<wire::CodecError>(remote.error());
    }
    const bool changed = store_.merge_graph(*remote);
    if (changed) {
        observer_.record({obs::EventKind::GossipMerged, {},
                          std::to_string(state::edge_count(store_.network_graph())) + " edges"});
    }
    return changed;
}

} // namespace swarm::gossip
