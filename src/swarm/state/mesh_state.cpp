// MeshStateStore - RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock, copy current snapshot, mutate, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period: old snapshots stay
// alive until the last reader drops its ref.

#include "swarm/state/mesh_state.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <utility>

namespace swarm::state {

//------------------------------- Snapshot helpers -----------------------------

int MeshSnapshot::retry_count(const DeviceName& name) const noexcept {
    const auto it = retries.find(name);
    return it == retries.end() ? 0 : it->second;
}

const DeviceState* MeshSnapshot::find(const EndpointId& endpoint) const noexcept {
    const auto it = devices.find(endpoint);
    return it == devices.end() ? nullptr : &it->second;
}

const DeviceState* MeshSnapshot::find_by_name(const DeviceName& name) const noexcept {
    const DeviceState* best = nullptr;
    for (const auto& [ep, d] : devices) {
        if (d.name != name) continue;
        if (d.phase == ConnectionPhase::Connected) return &d;
        if (!best || (d.phase == ConnectionPhase::Connecting && best->phase != ConnectionPhase::Connecting)) {
            best = &d;
        }
    }
    return best;
}

bool MeshSnapshot::name_in_phase(const DeviceName& name, ConnectionPhase phase) const noexcept {
    for (const auto& [ep, d] : devices) {
        if (d.name == name && d.phase == phase) return true;
    }
    return false;
}

bool MeshSnapshot::name_busy(const DeviceName& name) const noexcept {
    for (const auto& [ep, d] : devices) {
        if (d.name == name && is_busy(d.phase)) return true;
    }
    return false;
}

std::vector<DeviceState> MeshSnapshot::in_phase(ConnectionPhase phase) const {
    std::vector<DeviceState> out;
    for (const auto& [ep, d] : devices) {
        if (d.phase == phase) out.push_back(d);
    }
    return out;
}

std::size_t MeshSnapshot::busy_count(const EndpointId& except) const noexcept {
    std::size_t n = 0;
    for (const auto& [ep, d] : devices) {
        if (ep != except && is_busy(d.phase)) ++n;
    }
    return n;
}

std::size_t MeshSnapshot::connected_count(const EndpointId& except) const noexcept {
    std::size_t n = 0;
    for (const auto& [ep, d] : devices) {
        if (ep != except && d.phase == ConnectionPhase::Connected) ++n;
    }
    return n;
}

std::chrono::milliseconds PhaseTimeouts::for_phase(ConnectionPhase p) const noexcept {
    switch (p) {
        case ConnectionPhase::Discovered:   return discovered;
        case ConnectionPhase::Connecting:   return connecting;
        case ConnectionPhase::Connected:    return connected;
        case ConnectionPhase::Disconnected: return disconnected;
        case ConnectionPhase::Error:        return error;
    }
    return std::chrono::milliseconds{0};
}

//------------------------------- Public API -----------------------------------

MeshStateStore::MeshStateStore(DeviceName self) : self_(std::move(self)) {}

std::shared_ptr<const MeshSnapshot> MeshStateStore::snapshot() const noexcept {
    // RCU read: acquire pairs with the RELEASE in mutate() so the reader also
    // observes the fully constructed snapshot.
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

std::optional<DeviceState> MeshStateStore::device(const EndpointId& endpoint) const {
    auto snap = snapshot();
    if (const auto* d = snap->find(endpoint)) return *d;
    return std::nullopt;
}

DeviceMap MeshStateStore::devices() const { return snapshot()->devices; }

EndpointSet MeshStateStore::potential_peers() const { return snapshot()->potential_peers; }

NetworkGraph MeshStateStore::network_graph() const { return snapshot()->graph; }

int MeshStateStore::retry_count(const DeviceName& name) const { return snapshot()->retry_count(name); }

uint64_t MeshStateStore::wait_for_change(uint64_t seen, std::chrono::milliseconds timeout,
                                         std::stop_token st) const {
    std::unique_lock<std::mutex> lk(change_mu_);
    change_cv_.wait_for(lk, st, timeout, [&] { return version() != seen; });
    return version();
}

bool MeshStateStore::device_discovered(const EndpointId& endpoint, const DeviceName& name,
                                       Clock::time_point now) {
    return mutate([&](MeshSnapshot& s) {
        auto [it, inserted] = s.devices.try_emplace(endpoint);
        auto& d = it->second;
        if (inserted) {
            d.endpoint = endpoint;
            d.name = name;
            d.retry_count = s.retry_count(name);
            apply_phase(s, d, ConnectionPhase::Discovered, now);
            return true;
        }
        bool changed = false;
        if (d.name != name) {
            d.name = name;
            d.retry_count = s.retry_count(name);
            changed = true;
        }
        if (!is_busy(d.phase) && d.phase != ConnectionPhase::Discovered) {
            apply_phase(s, d, ConnectionPhase::Discovered, now);
            changed = true;
        }
        if (d.phase == ConnectionPhase::Discovered && !s.potential_peers.contains(endpoint)) {
            s.potential_peers.insert(endpoint);
            changed = true;
        }
        return changed;
    });
}

bool MeshStateStore::device_lost(const EndpointId& endpoint) {
    return mutate([&](MeshSnapshot& s) {
        const bool erased = s.devices.erase(endpoint) > 0;
        const bool pooled = s.potential_peers.erase(endpoint) > 0;
        return erased || pooled;
    });
}

bool MeshStateStore::connection_initiated(const EndpointId& endpoint, const DeviceName& name,
                                          Clock::time_point now) {
    return mutate([&](MeshSnapshot& s) {
        auto [it, inserted] = s.devices.try_emplace(endpoint);
        auto& d = it->second;
        if (inserted) d.endpoint = endpoint;
        if (d.name != name) {
            d.name = name;
            d.retry_count = s.retry_count(name);
        }
        if (d.phase == ConnectionPhase::Connected) return inserted;
        apply_phase(s, d, ConnectionPhase::Connecting, now);
        return true;
    });
}

bool MeshStateStore::update_phase(const EndpointId& endpoint, ConnectionPhase phase, Clock::time_point now) {
    const bool changed = mutate([&](MeshSnapshot& s) {
        auto it = s.devices.find(endpoint);
        if (it == s.devices.end()) return false;
        apply_phase(s, it->second, phase, now);
        return true;
    });
    if (changed) phase_updates_.fetch_add(1, std::memory_order_relaxed);
    return changed;
}

bool MeshStateStore::transition_if(const EndpointId& endpoint, ConnectionPhase phase, const Guard& guard,
                                   Clock::time_point now) {
    const bool changed = mutate([&](MeshSnapshot& s) {
        auto it = s.devices.find(endpoint);
        if (it == s.devices.end()) return false;
        if (guard && !guard(s)) return false;
        apply_phase(s, it->second, phase, now);
        return true;
    });
    if (changed) phase_updates_.fetch_add(1, std::memory_order_relaxed);
    return changed;
}

void MeshStateStore::increment_retry(const DeviceName& name) {
    (void)mutate([&](MeshSnapshot& s) {
        ++s.retries[name];
        sync_retries(s, name);
        return true;
    });
}

void MeshStateStore::reset_retry(const DeviceName& name) {
    (void)mutate([&](MeshSnapshot& s) {
        auto it = s.retries.find(name);
        if (it == s.retries.end() || it->second == 0) return false;
        it->second = 0;
        sync_retries(s, name);
        return true;
    });
}

bool MeshStateStore::merge_graph(const NetworkGraph& remote) {
    const bool changed = mutate([&](MeshSnapshot& s) { return merge_into(s.graph, remote, self_); });
    if (changed) graph_merges_.fetch_add(1, std::memory_order_relaxed);
    return changed;
}

bool MeshStateStore::set_local_neighbors(const NeighborSet& neighbors) {
    return mutate([&](MeshSnapshot& s) {
        auto [it, inserted] = s.graph.try_emplace(self_, neighbors);
        if (inserted) return true;
        if (it->second == neighbors) return false;
        it->second = neighbors;
        return true;
    });
}

bool MeshStateStore::refresh_local_neighbors() {
    NeighborSet neighbors;
    for (const auto& d : snapshot()->in_phase(ConnectionPhase::Connected)) neighbors.insert(d.name);
    return set_local_neighbors(neighbors);
}

std::size_t MeshStateStore::expire_stale(Clock::time_point now, const PhaseTimeouts& timeouts) {
    std::size_t expired = 0;
    (void)mutate([&](MeshSnapshot& s) {
        for (auto it = s.devices.begin(); it != s.devices.end();) {
            auto& d = it->second;
            const auto limit = timeouts.for_phase(d.phase);
            if (limit.count() <= 0 || now - d.last_seen_at < limit) { ++it; continue; }

            ++expired;
            switch (d.phase) {
                case ConnectionPhase::Connecting:
                    // The transport never reported an outcome: count it as a failure.
                    ++s.retries[d.name];
                    sync_retries(s, d.name);
                    apply_phase(s, d, ConnectionPhase::Error, now);
                    break;
                case ConnectionPhase::Connected:
                    apply_phase(s, d, ConnectionPhase::Disconnected, now);
                    break;
                case ConnectionPhase::Disconnected:
                case ConnectionPhase::Error:
                    apply_phase(s, d, ConnectionPhase::Discovered, now);
                    break;
                case ConnectionPhase::Discovered:
                    s.potential_peers.erase(it->first);
                    it = s.devices.erase(it);
                    continue;
            }
            ++it;
        }
        return expired > 0;
    });
    expirations_.fetch_add(expired, std::memory_order_relaxed);
    return expired;
}

MeshStateStore::Stats MeshStateStore::stats() const noexcept {
    return Stats{publishes_.load(std::memory_order_relaxed),
                 phase_updates_.load(std::memory_order_relaxed),
                 graph_merges_.load(std::memory_order_relaxed),
                 expirations_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutation Core --------------------------------

bool MeshStateStore::mutate(const Mutator& fn) {
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto next = std::make_shared<MeshSnapshot>(*snapshot()); // copy-on-write
        if (!fn(*next)) return false;

        // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE.
        std::shared_ptr<const MeshSnapshot> cnext = std::move(next);
        std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
        version_.fetch_add(1, std::memory_order_acq_rel);
    }
    publishes_.fetch_add(1, std::memory_order_relaxed);
    {
        // Taking change_mu_ orders the notify after any waiter's predicate check.
        std::lock_guard<std::mutex> lk(change_mu_);
    }
    change_cv_.notify_all();
    return true;
}

void MeshStateStore::apply_phase(MeshSnapshot& s, DeviceState& d, ConnectionPhase phase, Clock::time_point now) {
    d.phase = phase;
    d.last_seen_at = now;
    if (is_busy(phase)) {
        s.potential_peers.erase(d.endpoint);
    } else {
        // Discovered, errored and disconnected peers are candidates again.
        s.potential_peers.insert(d.endpoint);
    }
}

void MeshStateStore::sync_retries(MeshSnapshot& s, const DeviceName& name) {
    const int n = s.retry_count(name);
    for (auto& [ep, d] : s.devices) {
        if (d.name == name) d.retry_count = n;
    }
}

} // namespace swarm::state
