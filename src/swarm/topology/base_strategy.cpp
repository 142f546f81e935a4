/**
 * @file base_strategy.cpp
 * @brief Base strategy loops and admission.
 */
#include "swarm/topology/base_strategy.hpp"

#include <chrono>
#include <vector>

#include "swarm/obs/log.hpp"

namespace swarm::topology {

using state::ConnectionPhase;
using state::DeviceState;
using state::MeshSnapshot;
using namespace std::chrono;

BaseStrategy::BaseStrategy(StrategyContext ctx, BaseStrategyConfig cfg)
    : ctx_(ctx), cfg_(cfg),
      dialer_(ctx, tasks_, BackoffPolicy{}, "base") {}

BaseStrategy::~BaseStrategy() { stop(); }

void BaseStrategy::start() {
    tasks_.reopen();
    tasks_.spawn([this](std::stop_token st) {
        while (sched::TaskGroup::sleep_for(st, milliseconds{cfg_.manage_period_ms})) {
            (void)manage_connections();
        }
    });
    if (cfg_.rotation_enabled) {
        tasks_.spawn([this](std::stop_token st) {
            for (;;) {
                const auto jitter = ctx_.rng.next_below(uint64_t{cfg_.rotation_jitter_max_ms} + 1);
                if (!sched::TaskGroup::sleep_for(st, milliseconds{cfg_.rotation_period_ms + jitter})) break;
                (void)connection_rotation();
            }
        });
    }
}

void BaseStrategy::stop() {
    tasks_.stop();
    dialer_.clear();
}

std::optional<DeviceState> BaseStrategy::manage_connections() {
    const auto snap = ctx_.store.snapshot();
    const auto max = ctx_.max_connections;

    std::vector<DeviceState> available;
    for (const auto& ep : snap->potential_peers) {
        const auto* d = snap->find(ep);
        if (!d || state::is_busy(d->phase) || snap->name_busy(d->name) || dialer_.is_pending(ep)) continue;
        available.push_back(*d);
    }
    if (available.empty()) return std::nullopt;

    // Prefer a peer the gossiped graph has never heard of: it likely bridges a partition.
    const DeviceState* novel = nullptr;
    for (const auto& d : available) {
        if (!state::has_vertex(snap->graph, d.name)) { novel = &d; break; }
    }

    if (snap->busy_count() >= max) {
        if (novel) (void)try_disconnect_redundant_peer(novel->name);
        return std::nullopt;
    }

    const DeviceState target = novel ? *novel : available.front();
    const bool started = dialer_.dial(target, [max](const MeshSnapshot& s, const DeviceState& d) {
        return s.busy_count(d.endpoint) < max;
    });
    if (!started) return std::nullopt;
    return target;
}

bool BaseStrategy::try_disconnect_redundant_peer(const DeviceName& candidate) {
    const auto snap = ctx_.store.snapshot();
    const auto neighbors = state::neighbors_of(snap->graph, ctx_.store.self());

    for (std::size_t a = 0; a < neighbors.size(); ++a) {
        for (std::size_t b = a + 1; b < neighbors.size(); ++b) {
            const auto& n1 = neighbors[a];
            const auto& n2 = neighbors[b];
            if (!state::has_edge(snap->graph, n1, n2) && !state::has_edge(snap->graph, n2, n1)) continue;

            // n1 and n2 reach each other without us: either link is redundant.
            const auto& victim = ctx_.rng.next_below(2) == 0 ? n1 : n2;
            if (!snap->name_in_phase(victim, ConnectionPhase::Connected)) continue;
            obs::logger()->info("[{}] base: dropping {} (triangle with {}) to make room for {}",
                                ctx_.store.self(), victim, victim == n1 ? n2 : n1, candidate);
            disconnect_name(victim, "redundant");
            return true;
        }
    }
    return false;
}

std::optional<DeviceName> BaseStrategy::connection_rotation() {
    const auto snap = ctx_.store.snapshot();
    if (snap->connected_count() < ctx_.max_connections) return std::nullopt;

    std::vector<DeviceName> leaves;
    for (const auto& d : snap->in_phase(ConnectionPhase::Connected)) {
        // A leaf hangs off us alone; a single edge elsewhere is a stale row.
        if (state::degree(snap->graph, d.name) == 1 && state::has_edge(snap->graph, d.name, ctx_.store.self())) {
            leaves.push_back(d.name);
        }
    }
    if (leaves.empty()) return std::nullopt;

    const auto victim = leaves[ctx_.rng.next_below(leaves.size())];
    disconnect_name(victim, "rotation");
    return victim;
}

Admission BaseStrategy::admit(const EndpointId& endpoint, const DeviceName& name) {
    const auto snap = ctx_.store.snapshot();
    if (snap->connected_count(endpoint) < ctx_.max_connections) return Admission::Accept;
    if (try_disconnect_redundant_peer(name)) return Admission::Accept;
    return Admission::Reject;
}

void BaseStrategy::on_connection_result(const EndpointId& endpoint, bool success) {
    obs::logger()->debug("[{}] base: result {} for {}", ctx_.store.self(), success ? "ok" : "failed", endpoint);
}

void BaseStrategy::on_disconnected(const EndpointId& endpoint) {
    obs::logger()->debug("[{}] base: {} disconnected", ctx_.store.self(), endpoint);
}

void BaseStrategy::disconnect_name(const DeviceName& name, const char* reason) {
    const auto snap = ctx_.store.snapshot();
    const auto* d = snap->find_by_name(name);
    if (!d || d->phase != ConnectionPhase::Connected) return;
    ctx_.observer.record({obs::EventKind::Pruned, name, reason});
    ctx_.transport.disconnect_from_endpoint(d->endpoint);
}

} // namespace swarm::topology
