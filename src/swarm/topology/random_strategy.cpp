/**
 * @file random_strategy.cpp
 * @brief Random fill / churn loop.
 */
#include "swarm/topology/random_strategy.hpp"

#include <chrono>
#include <vector>

#include "swarm/obs/log.hpp"

namespace swarm::topology {

using state::ConnectionPhase;
using state::DeviceState;
using state::MeshSnapshot;
using namespace std::chrono;

RandomStrategy::RandomStrategy(StrategyContext ctx, RandomStrategyConfig cfg)
    : ctx_(ctx), cfg_(cfg), dialer_(ctx, tasks_, cfg.backoff(), "random") {}

RandomStrategy::~RandomStrategy() { stop(); }

void RandomStrategy::start() {
    tasks_.reopen();
    tasks_.spawn([this](std::stop_token st) {
        for (;;) {
            const auto jitter = ctx_.rng.next_below(uint64_t{cfg_.loop_jitter_max_ms} + 1);
            if (!sched::TaskGroup::sleep_for(st, milliseconds{cfg_.loop_period_ms + jitter})) break;
            (void)run_cycle();
        }
    });
}

void RandomStrategy::stop() {
    tasks_.stop();
    dialer_.clear();
}

CycleAction RandomStrategy::run_cycle() {
    const auto snap = ctx_.store.snapshot();
    const auto max = ctx_.max_connections;

    if (snap->busy_count() < max) {
        const auto target = pick_candidate();
        if (!target) return CycleAction::Idle;
        const bool started = dialer_.dial(*target, [max](const MeshSnapshot& s, const DeviceState& d) {
            return d.phase == ConnectionPhase::Discovered && s.busy_count(d.endpoint) < max;
        });
        return started ? CycleAction::Dialed : CycleAction::Idle;
    }

    // Full: occasionally drop a random link so that closed islands reopen.
    if (ctx_.rng.unit() >= cfg_.churn_probability) return CycleAction::Idle;
    const auto connected = snap->in_phase(ConnectionPhase::Connected);
    if (connected.empty()) return CycleAction::Idle;
    const auto& victim = connected[ctx_.rng.next_below(connected.size())];
    obs::logger()->info("[{}] random: churning link to {}", ctx_.store.self(), victim.name);
    ctx_.observer.record({obs::EventKind::Churned, victim.name, "island breaker"});
    ctx_.transport.disconnect_from_endpoint(victim.endpoint);
    return CycleAction::Churned;
}

std::optional<DeviceState> RandomStrategy::pick_candidate() const {
    const auto snap = ctx_.store.snapshot();
    std::vector<DeviceState> all, fresh;
    for (const auto& ep : snap->potential_peers) {
        const auto* d = snap->find(ep);
        if (!d || d->phase != ConnectionPhase::Discovered) continue;
        if (snap->name_busy(d->name) || dialer_.is_pending(ep)) continue;
        all.push_back(*d);
        if (snap->retry_count(d->name) == 0) fresh.push_back(*d);
    }
    const auto& pool = fresh.empty() ? all : fresh;
    if (pool.empty()) return std::nullopt;
    return pool[ctx_.rng.next_below(pool.size())];
}

Admission RandomStrategy::admit(const EndpointId& endpoint, const DeviceName&) {
    return ctx_.store.snapshot()->busy_count(endpoint) < ctx_.max_connections ? Admission::Accept
                                                                              : Admission::Reject;
}

void RandomStrategy::on_connection_result(const EndpointId& endpoint, bool success) {
    obs::logger()->debug("[{}] random: result {} for {}", ctx_.store.self(), success ? "ok" : "failed", endpoint);
}

void RandomStrategy::on_disconnected(const EndpointId& endpoint) {
    obs::logger()->debug("[{}] random: {} disconnected", ctx_.store.self(), endpoint);
}

} // namespace swarm::topology
