#pragma once
/**
 * @file mesh_node.hpp
 * @brief One overlay participant: state store, strategy, gossip, healing and flooding
 *        wired to a transport.
 *
 * **Event dispatch**
 * - Transport events update the store first, then reach the strategy.
 * - Payloads are demultiplexed by frame type (gossip / routed message).
 *
 * **Lifecycle**
 * - create() binds the node as the transport's event sink (weakly).
 * - start() advertises and launches every component loop; stop() joins them all.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "swarm/config/config_loader.hpp"
#include "swarm/gossip/gossip_manager.hpp"
#include "swarm/healing/healing_service.hpp"
#include "swarm/obs/observability.hpp"
#include "swarm/routing/flood_router.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/state/mesh_state.hpp"
#include "swarm/topology/connection_strategy.hpp"
#include "swarm/transport/transport.hpp"
#include "swarm/util/random.hpp"

namespace swarm::node {

using state::DeviceName;
using state::EndpointId;

class MeshNode final : public transport::TransportEvents,
                       public std::enable_shared_from_this<MeshNode> {
public:
    /// Receives messages addressed to this node or broadcast.
    using MessageHandler = std::function<void(const wire::RoutedMessage&)>;

    /**
     * @brief Build a node and register it as @p transport's event sink.
     * @param cfg Configuration; device_name must be set.
     * @param transport Medium; must outlive the node.
     * @param rng Randomness; a SeededRandom from entropy when null.
     * @param observer Event sink; a log observer when null.
     */
    static std::shared_ptr<MeshNode> create(config::MeshConfig cfg,
                                            transport::Transport& transport,
                                            std::shared_ptr<util::RandomSource> rng = nullptr,
                                            std::unique_ptr<obs::Observer> observer = nullptr);
    ~MeshNode() override;

    MeshNode(const MeshNode&)            = delete;
    MeshNode& operator=(const MeshNode&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Flood an application message.
     * @param dest Device name, or BROADCAST for everyone.
     * @return The message id.
     */
    std::string send_message(const DeviceName& dest, wire::Bytes payload);

    void set_message_handler(MessageHandler h);

    /// One watchdog + dedup-cache sweep (normally run by the maintenance loop).
    std::size_t run_maintenance(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // -------- accessors --------
    [[nodiscard]] const DeviceName& name() const noexcept { return cfg_.device_name; }
    [[nodiscard]] const config::MeshConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] state::MeshStateStore& store() noexcept { return store_; }
    [[nodiscard]] topology::ConnectionStrategy& strategy() noexcept { return *strategy_; }
    [[nodiscard]] gossip::GossipManager& gossip() noexcept { return gossip_; }
    [[nodiscard]] healing::HealingService& healing() noexcept { return healing_; }
    [[nodiscard]] routing::FloodRouter& router() noexcept { return router_; }
    [[nodiscard]] obs::Observer& observer() noexcept { return *observer_; }

    // -------- transport::TransportEvents --------
    void on_endpoint_found(const EndpointId& endpoint, const DeviceName& name) override;
    void on_endpoint_lost(const EndpointId& endpoint) override;
    void on_connection_initiated(const EndpointId& endpoint, const DeviceName& name) override;
    void on_connection_result(const EndpointId& endpoint, transport::ConnectionStatus status) override;
    void on_disconnected(const EndpointId& endpoint) override;
    void on_payload_received(const EndpointId& endpoint, const transport::Bytes& payload) override;

private:
    MeshNode(config::MeshConfig cfg, transport::Transport& transport,
             std::shared_ptr<util::RandomSource> rng, std::unique_ptr<obs::Observer> observer);

    void handle_routed(const transport::Bytes& body);
    /// Recompute the local graph row after a connection change.
    void refresh_graph();

    config::MeshConfig cfg_;
    transport::Transport& transport_;
    std::shared_ptr<util::RandomSource> rng_;
    std::unique_ptr<obs::Observer> observer_;
    state::MeshStateStore store_;
    std::unique_ptr<topology::ConnectionStrategy> strategy_;
    gossip::GossipManager gossip_;
    healing::HealingService healing_;
    routing::FloodRouter router_;
    sched::TaskGroup maintenance_{"maintenance"};

    std::atomic<bool> running_{false};
    std::mutex handler_mu_;
    MessageHandler handler_;
};

} // namespace swarm::node
