/**
 * @file strategy_factory.cpp
 * @brief StrategyKind parsing and construction.
 */
#include "swarm/topology/strategy_factory.hpp"

namespace swarm::topology {

std::string_view to_string(StrategyKind k) noexcept {
    switch (k) {
        case StrategyKind::Base:   return "base";
        case StrategyKind::Ring:   return "ring";
        case StrategyKind::Random: return "random";
    }
    return "unknown";
}

std::optional<StrategyKind> strategy_from_string(std::string_view s) noexcept {
    if (s == "base") return StrategyKind::Base;
    if (s == "ring") return StrategyKind::Ring;
    if (s == "random" || s == "cockroach") return StrategyKind::Random;
    return std::nullopt;
}

std::unique_ptr<ConnectionStrategy>
make_strategy(StrategyKind kind, StrategyContext ctx, const StrategySettings& settings) {
    switch (kind) {
        case StrategyKind::Base:   return std::make_unique<BaseStrategy>(ctx, settings.base);
        case StrategyKind::Ring:   return std::make_unique<RingStrategy>(ctx, settings.ring);
        case StrategyKind::Random: return std::make_unique<RandomStrategy>(ctx, settings.random);
    }
    return std::make_unique<BaseStrategy>(ctx, settings.base);
}

} // namespace swarm::topology
