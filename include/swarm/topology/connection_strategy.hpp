#pragma once
/**
 * @file connection_strategy.hpp
 * @brief Common interface of the topology strategies and their shared context.
 * @details Exactly one strategy is active per node, chosen at startup. Every
 *          strategy keeps the number of CONNECTED peers at or below
 *          StrategyContext::max_connections.
 */

#include <cstdint>
#include <optional>
#include <string_view>

#include "swarm/obs/observability.hpp"
#include "swarm/state/mesh_state.hpp"
#include "swarm/transport/transport.hpp"
#include "swarm/util/random.hpp"

namespace swarm::topology {

    using state::DeviceName;
    using state::EndpointId;

    /// Which strategy a node runs.
    enum class StrategyKind : uint8_t { Base, Ring, Random };

    std::string_view to_string(StrategyKind k) noexcept;

    /// Parse "base" / "ring" / "random" (also "cockroach").
    std::optional<StrategyKind> strategy_from_string(std::string_view s) noexcept;

    /// Answer to an inbound connection request.
    enum class Admission : uint8_t { Accept, Reject };

    /** @struct StrategyContext
     *  @brief Collaborators injected into a strategy. All outlive it.
     */
    struct StrategyContext {
        state::MeshStateStore& store;
        transport::Transport&  transport;
        util::RandomSource&    rng;
        obs::Observer&         observer;
        uint32_t               max_connections;
    };

    /** @class ConnectionStrategy
     *  @brief Decides which peers to dial, accept and drop.
     */
    class ConnectionStrategy {
    public:
        virtual ~ConnectionStrategy() = default;

        [[nodiscard]] virtual StrategyKind kind() const noexcept = 0;

        /// Launch the strategy's background loops.
        virtual void start() = 0;

        /// Stop and join every loop; clears in-flight dial bookkeeping.
        virtual void stop() = 0;

        /**
         * @brief Decide on an inbound request.
         * @details Called after the store marked @p endpoint CONNECTING. The
         *          strategy may disconnect other peers to make room.
         */
        virtual Admission admit(const EndpointId& endpoint, const DeviceName& name) = 0;

        /// Handshake finished (either direction).
        virtual void on_connection_result(const EndpointId& endpoint, bool success) = 0;

        virtual void on_disconnected(const EndpointId& endpoint) = 0;
    };

} // namespace swarm::topology
