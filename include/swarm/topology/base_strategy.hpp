#pragma once
/**
 * @file base_strategy.hpp
 * @brief Graph-aware default strategy: fill capacity favoring novel peers,
 *        break triangles, rotate leaves.
 */

#include <cstdint>
#include <optional>

#include "swarm/config/constants.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/topology/connection_strategy.hpp"
#include "swarm/topology/dialer.hpp"

namespace swarm::topology {

/** @struct BaseStrategyConfig
 *  @brief Loop periods of the base strategy.
 */
struct BaseStrategyConfig {
    uint32_t manage_period_ms{config::constants::BASE_MANAGE_PERIOD_MS};            ///< Fill loop period
    uint32_t rotation_period_ms{config::constants::BASE_ROTATION_PERIOD_MS};        ///< Leaf rotation period
    uint32_t rotation_jitter_max_ms{config::constants::BASE_ROTATION_JITTER_MAX_MS}; ///< Added to rotation period
    bool     rotation_enabled{config::constants::BASE_ROTATION_ENABLED};
};

class BaseStrategy final : public ConnectionStrategy {
public:
    BaseStrategy(StrategyContext ctx, BaseStrategyConfig cfg);
    ~BaseStrategy() override;

    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::Base; }
    void start() override;
    void stop() override;
    Admission admit(const EndpointId& endpoint, const DeviceName& name) override;
    void on_connection_result(const EndpointId& endpoint, bool success) override;
    void on_disconnected(const EndpointId& endpoint) override;

    /**
     * @brief One pass of the fill loop.
     * @return The device a dial was started for, if any.
     */
    std::optional<state::DeviceState> manage_connections();

    /**
     * @brief Drop one member of a triangle among the local neighbors.
     * @param candidate Peer we want to make room for (logged only).
     * @return true iff a disconnect was issued.
     */
    bool try_disconnect_redundant_peer(const DeviceName& candidate);

    /// Disconnect a random leaf neighbor when at capacity. Returns the dropped name.
    std::optional<DeviceName> connection_rotation();

    [[nodiscard]] const Dialer& dialer() const noexcept { return dialer_; }
    [[nodiscard]] const BaseStrategyConfig& config() const noexcept { return cfg_; }

private:
    void disconnect_name(const DeviceName& name, const char* reason);

    StrategyContext ctx_;
    BaseStrategyConfig cfg_;
    sched::TaskGroup tasks_{"base"};
    Dialer dialer_;
};

} // namespace swarm::topology
