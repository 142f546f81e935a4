/**
 * @file dialer.cpp
 * @brief Backoff, re-validation and request handling for outbound dials.
 */
#include "swarm/topology/dialer.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "swarm/obs/log.hpp"

namespace swarm::topology {

using state::ConnectionPhase;
using state::MeshSnapshot;

bool Dialer::dial(const state::DeviceState& target, StillNeeded still_needed) {
    if (!reserve(target.endpoint)) return false;
    const bool spawned = tasks_.spawn([this, target, still_needed = std::move(still_needed)](std::stop_token st) {
        PendingGuard guard(*this, target.endpoint);
        attempt(st, target, still_needed);
    });
    if (!spawned) release(target.endpoint);
    return spawned;
}

void Dialer::attempt(std::stop_token st, const state::DeviceState& target, const StillNeeded& still_needed) {
    const int retries = ctx_.store.retry_count(target.name);
    const auto wait = backoff_.delay(retries, ctx_.rng);
    if (wait.count() > 0) {
        obs::logger()->debug("[{}] {}: backing off {} ms before {} (retry {})",
                             ctx_.store.self(), label_, wait.count(), target.name, retries);
        if (!sched::TaskGroup::sleep_for(st, wait)) return;
    }
    if (st.stop_requested()) return;

    // The world may have moved on while we slept: re-check on the live state.
    const auto& ep = target.endpoint;
    const bool claimed = ctx_.store.transition_if(
        ep, ConnectionPhase::Connecting,
        [&](const MeshSnapshot& s) {
            const auto* d = s.find(ep);
            if (!d || state::is_busy(d->phase) || s.name_busy(d->name)) return false;
            return !still_needed || still_needed(s, *d);
        });
    if (!claimed) {
        obs::logger()->debug("[{}] {}: dial to {} no longer needed", ctx_.store.self(), label_, target.name);
        return;
    }

    std::shared_ptr<Lifeline> lifeline;
    {
        std::lock_guard<std::mutex> lk(mu_);
        lifeline = lifeline_;
    }
    ctx_.observer.record({obs::EventKind::ConnectRequested, target.name, label_});
    ctx_.transport.request_connection(
        ctx_.store.self(), ep, [this, target, lifeline](transport::ConnectResult r) {
            std::lock_guard<std::mutex> lk(lifeline->mu);
            if (!lifeline->alive) return; // dialer cleared or gone
            on_request_result(target, r);
        });
}

void Dialer::on_request_result(const state::DeviceState& target, const transport::ConnectResult& r) {
    if (r) return; // handshake result follows through the transport events

    if (r.error() == transport::ConnectError::AlreadyConnected) {
        (void)ctx_.store.update_phase(target.endpoint, ConnectionPhase::Connected);
        ctx_.store.reset_retry(target.name);
        (void)ctx_.store.refresh_local_neighbors();
        ctx_.observer.record({obs::EventKind::Connected, target.name, "already connected"});
        return;
    }
    // An inbound handshake may have completed meanwhile (simultaneous dial):
    // only a device still waiting on this attempt counts as failed.
    const bool failed = ctx_.store.transition_if(
        target.endpoint, ConnectionPhase::Error,
        [&](const MeshSnapshot& s) {
            const auto* d = s.find(target.endpoint);
            return d && d->phase == ConnectionPhase::Connecting;
        });
    if (!failed) return;
    ctx_.store.increment_retry(target.name);
    ctx_.observer.record({obs::EventKind::ConnectFailed, target.name, std::string(transport::to_string(r.error()))});
}

bool Dialer::is_pending(const EndpointId& endpoint) const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.contains(endpoint);
}

std::size_t Dialer::pending_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

void Dialer::clear() {
    std::shared_ptr<Lifeline> old;
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.clear();
        old = std::exchange(lifeline_, std::make_shared<Lifeline>());
    }
    std::lock_guard<std::mutex> lk(old->mu);
    old->alive = false;
}

bool Dialer::reserve(const EndpointId& endpoint) {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.insert(endpoint).second;
}

void Dialer::release(const EndpointId& endpoint) {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.erase(endpoint);
}

} // namespace swarm::topology
