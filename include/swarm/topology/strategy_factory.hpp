#pragma once
/**
 * @file strategy_factory.hpp
 * @brief Builds the configured ConnectionStrategy.
 */

#include <memory>

#include "swarm/topology/base_strategy.hpp"
#include "swarm/topology/random_strategy.hpp"
#include "swarm/topology/ring_strategy.hpp"

namespace swarm::topology {

/// Per-strategy settings; only the one matching the chosen kind is used.
struct StrategySettings {
    BaseStrategyConfig   base;
    RingStrategyConfig   ring;
    RandomStrategyConfig random;
};

[[nodiscard]] std::unique_ptr<ConnectionStrategy>
make_strategy(StrategyKind kind, StrategyContext ctx, const StrategySettings& settings);

} // namespace swarm::topology
