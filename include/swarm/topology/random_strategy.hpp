#pragma once
/**
 * @file random_strategy.hpp
 * @brief "Cockroach" strategy: random fill plus random churn to dissolve islands.
 */

#include <cstdint>
#include <optional>

#include "swarm/config/constants.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/topology/connection_strategy.hpp"
#include "swarm/topology/dialer.hpp"

namespace swarm::topology {

/** @struct RandomStrategyConfig
 *  @brief Loop cadence, churn odds and backoff of the random strategy.
 */
struct RandomStrategyConfig {
    uint32_t loop_period_ms{config::constants::RANDOM_LOOP_PERIOD_MS};
    uint32_t loop_jitter_max_ms{config::constants::RANDOM_LOOP_JITTER_MAX_MS};
    double   churn_probability{config::constants::RANDOM_CHURN_PROBABILITY};   ///< per cycle, at capacity
    uint32_t backoff_base_ms{config::constants::RANDOM_BACKOFF_BASE_MS};
    uint32_t backoff_max_exponent{config::constants::RANDOM_BACKOFF_MAX_EXPONENT};

    [[nodiscard]] BackoffPolicy backoff() const noexcept {
        return BackoffPolicy{backoff_base_ms, backoff_max_exponent, 0, 0};
    }
};

/// What one loop iteration did.
enum class CycleAction : uint8_t { Idle, Dialed, Churned };

class RandomStrategy final : public ConnectionStrategy {
public:
    RandomStrategy(StrategyContext ctx, RandomStrategyConfig cfg);
    ~RandomStrategy() override;

    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::Random; }
    void start() override;
    void stop() override;
    Admission admit(const EndpointId& endpoint, const DeviceName& name) override;
    void on_connection_result(const EndpointId& endpoint, bool success) override;
    void on_disconnected(const EndpointId& endpoint) override;

    /// One iteration of the loop body (no sleeping).
    CycleAction run_cycle();

    /// Candidate to dial: DISCOVERED, not busy, not pending; never-failed peers first.
    [[nodiscard]] std::optional<state::DeviceState> pick_candidate() const;

    [[nodiscard]] const Dialer& dialer() const noexcept { return dialer_; }

private:
    StrategyContext ctx_;
    RandomStrategyConfig cfg_;
    sched::TaskGroup tasks_{"random"};
    Dialer dialer_;
};

} // namespace swarm::topology
