#pragma once
/**
 * @file gossip_manager.hpp
 * @brief Anti-entropy dissemination of the network graph.
 * @details Periodically broadcasts the local graph to all connected peers and
 *          union-merges every graph received. Views converge after enough rounds;
 *          no peer is authoritative for anyone else's edges.
 */

#include <atomic>
#include <cstdint>
#include <span>

#include "swarm/compat/expected.hpp"
#include "swarm/config/constants.hpp"
#include "swarm/obs/observability.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/state/mesh_state.hpp"
#include "swarm/transport/transport.hpp"
#include "swarm/wire/frame.hpp"

namespace swarm::gossip {

/** @struct GossipConfig
 *  @brief Gossip cadence.
 */
struct GossipConfig {
    uint32_t period_ms{config::constants::GOSSIP_PERIOD_MS}; ///< Broadcast interval
};

class GossipManager final {
public:
    GossipManager(state::MeshStateStore& store, transport::Transport& transport,
                  obs::Observer& observer, GossipConfig cfg = {})
        : store_(store), transport_(transport), observer_(observer), cfg_(cfg) {}
    ~GossipManager() { stop(); }

    GossipManager(const GossipManager&)            = delete;
    GossipManager& operator=(const GossipManager&) = delete;

    void start();
    void stop();

    /**
     * @brief Broadcast the current graph now.
     * @return false if the graph is empty (nothing sent).
     */
    bool broadcast_now();

    /**
     * @brief Merge a received TOPOLOGY_GOSSIP body.
     * @return Whether the local graph changed, or the decode error.
     */
    swarm_detail::expected<bool, wire::CodecError> on_gossip(std::span<const uint8_t> body);

    [[nodiscard]] uint64_t rounds() const noexcept { return rounds_.load(std::memory_order_relaxed); }

private:
    state::MeshStateStore& store_;
    transport::Transport& transport_;
    obs::Observer& observer_;
    GossipConfig cfg_;
    sched::TaskGroup tasks_{"gossip"};
    std::atomic<uint64_t> rounds_{0};
};

} // namespace swarm::gossip
