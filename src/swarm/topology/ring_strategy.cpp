/**
 * @file ring_strategy.cpp
 * @brief Reactive ring maintenance.
 */
#include "swarm/topology/ring_strategy.hpp"

#include <algorithm>
#include <chrono>

#include "swarm/obs/log.hpp"

namespace swarm::topology {

using state::ConnectionPhase;
using state::DeviceState;
using state::MeshSnapshot;
using namespace std::chrono;

std::vector<DeviceName> known_names(const MeshSnapshot& s) {
    // Every tracked device counts: pooled peers plus the ones we are linked
    // or linking to. Dropping CONNECTING names would shrink the ring mid-dial.
    std::vector<DeviceName> out;
    out.reserve(s.devices.size());
    for (const auto& [ep, d] : s.devices) out.push_back(d.name);
    return out;
}

std::set<DeviceName> names_in(const MeshSnapshot& s, bool include_connecting) {
    std::set<DeviceName> out;
    for (const auto& [ep, d] : s.devices) {
        if (d.phase == ConnectionPhase::Connected ||
            (include_connecting && d.phase == ConnectionPhase::Connecting)) {
            out.insert(d.name);
        }
    }
    return out;
}

RingStrategy::RingStrategy(StrategyContext ctx, RingStrategyConfig cfg)
    : ctx_(ctx), cfg_(cfg), dialer_(ctx, tasks_, cfg.backoff(), "ring") {}

RingStrategy::~RingStrategy() { stop(); }

void RingStrategy::start() {
    tasks_.reopen();
    // Taken before either loop runs so the first evaluation is never missed.
    const uint64_t stability_seen = stability_.current().generation;
    tasks_.spawn([this](std::stop_token st) {
        uint64_t seen = ctx_.store.version();
        while (!st.stop_requested()) {
            (void)evaluate();
            seen = ctx_.store.wait_for_change(seen, milliseconds{cfg_.reevaluate_period_ms}, st);
        }
    });
    tasks_.spawn([this, stability_seen](std::stop_token st) { stability_loop(st, stability_seen); });
}

void RingStrategy::stop() {
    tasks_.stop();
    dialer_.clear();
}

RingPlan RingStrategy::plan_for(const MeshSnapshot& s) const {
    return plan_ring(known_names(s), ctx_.store.self(), cfg_.min_opposite_distance);
}

RingPlan RingStrategy::current_plan() const { return plan_for(*ctx_.store.snapshot()); }

bool RingStrategy::evaluate() {
    const auto snap = ctx_.store.snapshot();
    const auto plan = plan_for(*snap);
    if (!plan.valid()) {
        stability_.publish(false);
        return false;
    }

    const auto connected = names_in(*snap, false);
    const auto busy = names_in(*snap, true);
    const auto max = ctx_.max_connections;

    for (const auto& target : plan.dial_targets()) {
        if (busy.contains(target)) continue;
        const auto* d = snap->find_by_name(target);
        if (!d || dialer_.is_pending(d->endpoint)) continue;
        if (dialer_.dial(*d, [this, max](const MeshSnapshot& s, const DeviceState& dev) {
                return plan_for(s).dial_targets().contains(dev.name) && s.connected_count(dev.endpoint) < max;
            })) {
            obs::logger()->debug("[{}] ring: dialing {}", ctx_.store.self(), target);
        }
    }

    for (const auto& name : select_prunes(plan, connected, busy, max)) {
        const auto* d = snap->find_by_name(name);
        if (!d || d->phase != ConnectionPhase::Connected) continue;
        obs::logger()->info("[{}] ring: pruning spare {}", ctx_.store.self(), name);
        ctx_.observer.record({obs::EventKind::Pruned, name, "ring spare"});
        ctx_.transport.disconnect_from_endpoint(d->endpoint);
    }

    const bool stable = is_ring_stable(plan, connected);
    stability_.publish(stable);
    return stable;
}

void RingStrategy::stability_loop(std::stop_token st, uint64_t seen) {
    while (auto next = stability_.wait_next(st, seen)) {
        seen = next->generation;
        ctx_.observer.record({obs::EventKind::StabilityChanged, {}, next->value ? "stable" : "unstable"});
        if (!next->value) {
            // Broken ring: look for members right away.
            ctx_.transport.start_discovery();
            continue;
        }
        if (stability_.wait_quiet(st, seen, milliseconds{cfg_.stability_debounce_ms}) &&
            cfg_.reduce_discovery_when_stable) {
            obs::logger()->info("[{}] ring: stable for {} ms, pausing discovery",
                                ctx_.store.self(), cfg_.stability_debounce_ms);
            ctx_.transport.stop_discovery();
        }
    }
}

Admission RingStrategy::admit(const EndpointId& endpoint, const DeviceName& name) {
    const auto snap = ctx_.store.snapshot();

    auto names = known_names(*snap);
    names.erase(std::remove(names.begin(), names.end(), name), names.end());
    const auto without = plan_ring(names, ctx_.store.self(), cfg_.min_opposite_distance);
    names.push_back(name);
    const auto with = plan_ring(names, ctx_.store.self(), cfg_.min_opposite_distance);

    if (with.is_immediate_neighbor(name)) {
        // The requester cuts in between us and an old neighbor: drop the one it displaces.
        const std::optional<DeviceName> displaced[] = {
            with.successor == name ? without.successor : std::nullopt,
            with.predecessor == name ? without.predecessor : std::nullopt,
        };
        for (const auto& old : displaced) {
            if (!old || *old == name || with.is_immediate_neighbor(*old)) continue;
            const auto* d = snap->find_by_name(*old);
            if (!d || d->phase != ConnectionPhase::Connected) continue;
            obs::logger()->info("[{}] ring: {} cuts in, dropping displaced {}", ctx_.store.self(), name, *old);
            ctx_.observer.record({obs::EventKind::Pruned, *old, "displaced by " + name});
            ctx_.transport.disconnect_from_endpoint(d->endpoint);
        }
        return Admission::Accept;
    }
    return snap->connected_count(endpoint) < ctx_.max_connections ? Admission::Accept : Admission::Reject;
}

void RingStrategy::on_connection_result(const EndpointId& endpoint, bool success) {
    obs::logger()->debug("[{}] ring: result {} for {}", ctx_.store.self(), success ? "ok" : "failed", endpoint);
    stability_.publish(false);
}

void RingStrategy::on_disconnected(const EndpointId& endpoint) {
    obs::logger()->debug("[{}] ring: {} disconnected", ctx_.store.self(), endpoint);
    stability_.publish(false);
}

} // namespace swarm::topology
