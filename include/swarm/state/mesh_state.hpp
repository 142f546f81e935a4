#pragma once
// Swarm - MeshStateStore
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics and reason
//     about one consistent view for a whole decision cycle.
//   • Writers are serialized by a mutex, copy the snapshot, mutate, and publish
//     with RELEASE semantics. A guard evaluated under the writer lock gives
//     compare-and-set transitions.
//   • Every published change bumps a version and wakes change subscribers.


#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <vector>

#include "swarm/config/constants.hpp"
#include "swarm/state/device_state.hpp"
#include "swarm/state/network_graph.hpp"

namespace swarm::state {

using DeviceMap    = std::map<EndpointId, DeviceState>;
using EndpointSet  = std::set<EndpointId>;
using RetryMap     = std::map<DeviceName, int>;

/// Immutable view published by the store.
struct MeshSnapshot final {
    DeviceMap    devices;         ///< endpoint -> state
    EndpointSet  potential_peers; ///< discovered, not connected/connecting
    RetryMap     retries;         ///< failed attempts keyed by persistent name
    NetworkGraph graph;           ///< gossiped adjacency view

    /// Retry count for a name (0 if never failed).
    [[nodiscard]] int retry_count(const DeviceName& name) const noexcept;

    /// Device for an endpoint, or nullptr.
    [[nodiscard]] const DeviceState* find(const EndpointId& endpoint) const noexcept;

    /// Best device for a name: CONNECTED, then CONNECTING, then any. nullptr if unknown.
    [[nodiscard]] const DeviceState* find_by_name(const DeviceName& name) const noexcept;

    /// True if some endpoint of @p name is in @p phase.
    [[nodiscard]] bool name_in_phase(const DeviceName& name, ConnectionPhase phase) const noexcept;

    /// True if some endpoint of @p name is CONNECTED or CONNECTING.
    [[nodiscard]] bool name_busy(const DeviceName& name) const noexcept;

    /// Devices currently in @p phase.
    [[nodiscard]] std::vector<DeviceState> in_phase(ConnectionPhase phase) const;

    /// Number of devices that are CONNECTED or CONNECTING, optionally ignoring one endpoint.
    [[nodiscard]] std::size_t busy_count(const EndpointId& except = {}) const noexcept;

    /// Number of CONNECTED devices, optionally ignoring one endpoint.
    [[nodiscard]] std::size_t connected_count(const EndpointId& except = {}) const noexcept;
};

/// Per-phase watchdog limits. Zero disables the limit for that phase.
struct PhaseTimeouts {
    std::chrono::milliseconds discovered{0};
    std::chrono::milliseconds connecting{0};
    std::chrono::milliseconds connected{0};
    std::chrono::milliseconds disconnected{0};
    std::chrono::milliseconds error{0};

    [[nodiscard]] std::chrono::milliseconds for_phase(ConnectionPhase p) const noexcept;
};

/** @struct WatchdogConfig
 *  @brief How often the watchdog sweeps and how long each phase may last.
 */
struct WatchdogConfig {
    uint32_t sweep_period_ms{swarm::config::constants::WATCHDOG_SWEEP_PERIOD_MS};   ///< Sweep cadence
    uint32_t discovered_ms{swarm::config::constants::WATCHDOG_DISCOVERED_MS};       ///< 0 = never forget
    uint32_t connecting_ms{swarm::config::constants::WATCHDOG_CONNECTING_MS};       ///< -> ERROR (+retry)
    uint32_t connected_ms{swarm::config::constants::WATCHDOG_CONNECTED_MS};         ///< 0 = no limit
    uint32_t disconnected_ms{swarm::config::constants::WATCHDOG_DISCONNECTED_MS};   ///< -> DISCOVERED
    uint32_t error_ms{swarm::config::constants::WATCHDOG_ERROR_MS};                 ///< -> DISCOVERED

    [[nodiscard]] PhaseTimeouts timeouts() const noexcept {
        using ms = std::chrono::milliseconds;
        return PhaseTimeouts{ms{discovered_ms}, ms{connecting_ms}, ms{connected_ms},
                             ms{disconnected_ms}, ms{error_ms}};
    }
};

// -----------------------------------------------------------------------------
// MeshStateStore
// -----------------------------------------------------------------------------
///
/// Shared state of one node: devices, potential-peer pool, retry counters and
/// the network graph. Injected into every component; there is no global instance.
///
/// Thread-safety:
///   - Reads are lock-free and return immutable snapshots.
///   - Mutations are serialized; none is lost under concurrent writers.
///   - Mutations that change nothing do not publish and do not notify.
//
class MeshStateStore final {
public:
    using Clock = std::chrono::steady_clock;
    using Guard = std::function<bool(const MeshSnapshot&)>;

    /// @param self Local device name; its graph row is only written locally.
    explicit MeshStateStore(DeviceName self);

    MeshStateStore(const MeshStateStore&)            = delete;
    MeshStateStore& operator=(const MeshStateStore&) = delete;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Consistent snapshot of the entire state.
    [[nodiscard]] std::shared_ptr<const MeshSnapshot> snapshot() const noexcept;

    [[nodiscard]] std::optional<DeviceState> device(const EndpointId& endpoint) const;
    [[nodiscard]] DeviceMap devices() const;
    [[nodiscard]] EndpointSet potential_peers() const;
    [[nodiscard]] NetworkGraph network_graph() const;
    [[nodiscard]] int retry_count(const DeviceName& name) const;

    [[nodiscard]] const DeviceName& self() const noexcept { return self_; }

    /// Monotonic version. Increments on every published mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_acquire); }

    /**
     * @brief Block until version() != @p seen, the timeout elapses, or stop is requested.
     * @return The version observed on wake-up.
     */
    uint64_t wait_for_change(uint64_t seen, std::chrono::milliseconds timeout, std::stop_token st) const;

    // --------------------------- Membership ----------------------------------
    /// Discovery callback: create/refresh a DISCOVERED device and add it to the pool.
    /// Devices already CONNECTED or CONNECTING only get their name refreshed.
    bool device_discovered(const EndpointId& endpoint, const DeviceName& name, Clock::time_point now = Clock::now());

    /// Endpoint lost: forget the device and drop it from the pool.
    bool device_lost(const EndpointId& endpoint);

    /// Inbound connection request: create/refresh the device as CONNECTING.
    bool connection_initiated(const EndpointId& endpoint, const DeviceName& name, Clock::time_point now = Clock::now());

    // --------------------------- Phase ---------------------------------------
    /// Atomic phase transition. Returns false for unknown endpoints.
    bool update_phase(const EndpointId& endpoint, ConnectionPhase phase, Clock::time_point now = Clock::now());

    /// Compare-and-set: transition only if @p guard holds on the current snapshot.
    bool transition_if(const EndpointId& endpoint, ConnectionPhase phase, const Guard& guard,
                       Clock::time_point now = Clock::now());

    // --------------------------- Retries -------------------------------------
    void increment_retry(const DeviceName& name);
    void reset_retry(const DeviceName& name);

    // --------------------------- Graph ---------------------------------------
    /// Union-merge a remote graph (never removes edges, ignores the local row).
    bool merge_graph(const NetworkGraph& remote);

    /// Replace the local row with the given neighbor set.
    bool set_local_neighbors(const NeighborSet& neighbors);

    /// Rebuild the local row from the CONNECTED devices.
    bool refresh_local_neighbors();

    // --------------------------- Watchdog ------------------------------------
    /// Apply per-phase timeouts. Returns how many devices changed.
    std::size_t expire_stale(Clock::time_point now, const PhaseTimeouts& timeouts);

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t publishes{0}, phase_updates{0}, graph_merges{0}, expirations{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    using Mutator = std::function<bool(MeshSnapshot&)>;

    /// Copy-on-write under the writer lock; publishes only if @p fn reports a change.
    bool mutate(const Mutator& fn);

    /// Set phase + timestamp and keep the pool consistent with the phase.
    static void apply_phase(MeshSnapshot& s, DeviceState& d, ConnectionPhase phase, Clock::time_point now);

    /// Mirror the per-name retry counter into every device with that name.
    static void sync_retries(MeshSnapshot& s, const DeviceName& name);

    DeviceName self_;
    std::shared_ptr<const MeshSnapshot> snap_{std::make_shared<MeshSnapshot>()};
    std::mutex write_mu_;
    std::atomic<uint64_t> version_{0};

    mutable std::mutex change_mu_;
    mutable std::condition_variable_any change_cv_;

    std::atomic<uint64_t> publishes_{0}, phase_updates_{0}, graph_merges_{0}, expirations_{0};
};

} // namespace swarm::state
