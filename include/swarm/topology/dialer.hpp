#pragma once
/**
 * @file dialer.hpp
 * @brief Outbound connection attempts shared by all strategies.
 *
 * One attempt = mark pending, back off (if the peer failed before), re-validate
 * against a fresh snapshot, move to CONNECTING with a compare-and-set, then
 * request the connection. The pending mark is cleared on every exit path.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <utility>

#include "swarm/sched/task_group.hpp"
#include "swarm/topology/backoff.hpp"
#include "swarm/topology/connection_strategy.hpp"

namespace swarm::topology {

class Dialer final {
public:
    /// Re-validation run under the store writer lock right before CONNECTING.
    using StillNeeded = std::function<bool(const state::MeshSnapshot&, const state::DeviceState&)>;

    Dialer(StrategyContext ctx, sched::TaskGroup& tasks, BackoffPolicy backoff, std::string label)
        : ctx_(ctx), tasks_(tasks), backoff_(backoff), label_(std::move(label)) {}

    ~Dialer() { clear(); }

    Dialer(const Dialer&)            = delete;
    Dialer& operator=(const Dialer&) = delete;

    /**
     * @brief Start an attempt on its own task.
     * @return false if the endpoint already has an attempt in flight or the
     *         task group is closed.
     */
    bool dial(const state::DeviceState& target, StillNeeded still_needed);

    /// Run one attempt on the calling thread (used by dial()).
    void attempt(std::stop_token st, const state::DeviceState& target, const StillNeeded& still_needed);

    [[nodiscard]] bool is_pending(const EndpointId& endpoint) const;
    [[nodiscard]] std::size_t pending_count() const;

    /**
     * @brief Forget pending marks and detach outstanding request callbacks.
     * @details Callbacks handed to the transport before clear() become no-ops,
     *          so a late answer never reaches a stopped strategy. Blocks while
     *          such a callback is running.
     */
    void clear();

    [[nodiscard]] const BackoffPolicy& backoff() const noexcept { return backoff_; }

private:
    /// Clears the pending mark when an attempt ends, however it ends.
    class PendingGuard {
    public:
        PendingGuard(Dialer& d, EndpointId ep) : d_(d), ep_(std::move(ep)) {}
        ~PendingGuard() { d_.release(ep_); }
        PendingGuard(const PendingGuard&)            = delete;
        PendingGuard& operator=(const PendingGuard&) = delete;
    private:
        Dialer& d_;
        EndpointId ep_;
    };

    /// Shared with request callbacks; alive is false once the dialer is cleared.
    struct Lifeline {
        std::mutex mu;
        bool alive = true;
    };

    bool reserve(const EndpointId& endpoint);
    void release(const EndpointId& endpoint);

    /// Request outcome: reconcile races, count failures.
    void on_request_result(const state::DeviceState& target, const transport::ConnectResult& r);

    StrategyContext ctx_;
    sched::TaskGroup& tasks_;
    BackoffPolicy backoff_;
    std::string label_;

    mutable std::mutex mu_;
    std::set<EndpointId> pending_;
    std::shared_ptr<Lifeline> lifeline_ = std::make_shared<Lifeline>();
};

} // namespace swarm::topology
