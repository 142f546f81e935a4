#pragma once
/**
 * @file ring_strategy.hpp
 * @brief Reactive ring overlay: successor + predecessor + one long-range chord.
 *
 * Every store change triggers a re-evaluation of the ring built from all known
 * names. Stability (all ring links up) is published into a debounced signal
 * that arms discovery when the ring breaks.
 */

#include <cstdint>
#include <set>

#include "swarm/config/constants.hpp"
#include "swarm/sched/debounced_signal.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/topology/connection_strategy.hpp"
#include "swarm/topology/dialer.hpp"
#include "swarm/topology/ring_math.hpp"

namespace swarm::topology {

/** @struct RingStrategyConfig
 *  @brief Debounce and backoff of the ring strategy.
 */
struct RingStrategyConfig {
    uint32_t stability_debounce_ms{config::constants::RING_STABILITY_DEBOUNCE_MS};
    uint32_t reevaluate_period_ms{config::constants::RING_REEVALUATE_PERIOD_MS};   ///< re-run even without changes
    uint32_t backoff_base_ms{config::constants::RING_BACKOFF_BASE_MS};
    uint32_t backoff_max_exponent{config::constants::RING_BACKOFF_MAX_EXPONENT};
    uint32_t backoff_jitter_max_ms{config::constants::RING_BACKOFF_JITTER_MAX_MS};
    uint32_t min_opposite_distance{config::constants::RING_MIN_OPPOSITE_DISTANCE};
    bool     reduce_discovery_when_stable{config::constants::RING_REDUCE_DISCOVERY_STABLE};

    [[nodiscard]] BackoffPolicy backoff() const noexcept {
        return BackoffPolicy{backoff_base_ms, backoff_max_exponent, -1, backoff_jitter_max_ms};
    }
};

class RingStrategy final : public ConnectionStrategy {
public:
    RingStrategy(StrategyContext ctx, RingStrategyConfig cfg);
    ~RingStrategy() override;

    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::Ring; }
    void start() override;
    void stop() override;
    Admission admit(const EndpointId& endpoint, const DeviceName& name) override;
    void on_connection_result(const EndpointId& endpoint, bool success) override;
    void on_disconnected(const EndpointId& endpoint) override;

    /// Ring over every known name (pool + connecting + connected + self).
    [[nodiscard]] RingPlan current_plan() const;

    /**
     * @brief One reaction pass: dial missing ring links, prune spares,
     *        publish stability.
     * @return Whether the ring is stable on the evaluated snapshot.
     */
    bool evaluate();

    [[nodiscard]] bool is_stable() const { return stability_.current().value; }
    [[nodiscard]] const Dialer& dialer() const noexcept { return dialer_; }

private:
    [[nodiscard]] RingPlan plan_for(const state::MeshSnapshot& s) const;
    /// Reacts to stability events newer than @p seen.
    void stability_loop(std::stop_token st, uint64_t seen);

    StrategyContext ctx_;
    RingStrategyConfig cfg_;
    sched::TaskGroup tasks_{"ring"};
    Dialer dialer_;
    sched::DebouncedSignal stability_{false};
};

/// Names known to the local node: pool members plus connected and connecting peers.
[[nodiscard]] std::vector<DeviceName> known_names(const state::MeshSnapshot& s);

/// Names whose device is CONNECTED (and, with @p include_connecting, CONNECTING).
[[nodiscard]] std::set<DeviceName> names_in(const state::MeshSnapshot& s, bool include_connecting);

} // namespace swarm::topology
