/**
 * @file sim_network.cpp
 * @brief Implementation of the in-process transport simulator.
 * @details Every command collects its event deliveries under the hub lock and
 *          runs them after releasing it.
 */
#include "swarm/transport/sim_network.hpp"

namespace swarm::transport {

    // ------------------------------------------------------------------------
    // SimNetwork
    // ------------------------------------------------------------------------

    std::shared_ptr<SimNetwork> SimNetwork::create() {
        return std::shared_ptr<SimNetwork>(new SimNetwork());
    }

    std::shared_ptr<SimTransport> SimNetwork::attach(const DeviceName& name) {
        std::lock_guard<std::mutex> lk(mu_);
        EndpointId ep = "ep-" + std::to_string(next_id_++);
        auto t = std::make_shared<SimTransport>(shared_from_this(), ep, name);
        nodes_[ep] = Node{name, t, false, false};
        return t;
    }

    void SimNetwork::detach(const DeviceName& name) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            EndpointId gone;
            for (const auto& [ep, n] : nodes_) {
                if (n.name == name) { gone = ep; break; }
            }
            if (gone.empty()) return;

            for (auto it = links_.begin(); it != links_.end();) {
                if (it->first != gone && it->second != gone) { ++it; continue; }
                const EndpointId peer = it->first == gone ? it->second : it->first;
                emit(out, peer, [gone](TransportEvents& s) { s.on_disconnected(gone); });
                it = links_.erase(it);
            }
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->first.first != gone && it->first.second != gone) { ++it; continue; }
                const EndpointId peer = it->first.first == gone ? it->first.second : it->first.first;
                emit(out, peer, [gone](TransportEvents& s) {
                    s.on_connection_result(gone, ConnectionStatus::Error);
                });
                it = pending_.erase(it);
            }
            nodes_.erase(gone);
            for (const auto& [ep, n] : nodes_) {
                emit(out, ep, [gone](TransportEvents& s) { s.on_endpoint_lost(gone); });
            }
        }
        run(out);
    }

    void SimNetwork::set_link_filter(LinkFilter filter) {
        std::lock_guard<std::mutex> lk(mu_);
        filter_ = std::move(filter);
    }

    std::set<DeviceName> SimNetwork::links_of(const DeviceName& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::set<DeviceName> out;
        for (const auto& [a, b] : links_) {
            const auto na = nodes_.find(a);
            const auto nb = nodes_.find(b);
            if (na == nodes_.end() || nb == nodes_.end()) continue;
            if (na->second.name == name) out.insert(nb->second.name);
            if (nb->second.name == name) out.insert(na->second.name);
        }
        return out;
    }

    std::size_t SimNetwork::link_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return links_.size();
    }

    EndpointId SimNetwork::endpoint_of(const DeviceName& name) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [ep, n] : nodes_) {
            if (n.name == name) return ep;
        }
        return {};
    }

    SimNetwork::Pair SimNetwork::make_pair(const EndpointId& a, const EndpointId& b) {
        return a < b ? Pair{a, b} : Pair{b, a};
    }

    bool SimNetwork::reachable(const Node& a, const Node& b) const {
        return !filter_ || filter_(a.name, b.name);
    }

    void SimNetwork::emit(std::vector<Delivery>& out, const EndpointId& ep,
                          std::function<void(TransportEvents&)> fn) const {
        const auto it = nodes_.find(ep);
        if (it == nodes_.end()) return;
        std::weak_ptr<SimTransport> wt = it->second.transport;
        out.emplace_back([wt, fn = std::move(fn)] {
            auto t = wt.lock();
            if (!t) return;
            if (auto sink = t->sink()) fn(*sink);
        });
    }

    void SimNetwork::run(std::vector<Delivery>& out) {
        for (auto& d : out) d();
        out.clear();
    }

    void SimNetwork::request(const EndpointId& from, const DeviceName& announced,
                             const EndpointId& target, ConnectCallback cb) {
        std::vector<Delivery> out;
        ConnectResult result{};
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto me = nodes_.find(from);
            const auto peer = nodes_.find(target);
            const auto pair = make_pair(from, target);
            if (me == nodes_.end()) {
                result = swarm_detail::unexpected<ConnectError>(ConnectError::NotRunning);
            } else if (peer == nodes_.end() || from == target || !reachable(me->second, peer->second)) {
                result = swarm_detail::unexpected<ConnectError>(ConnectError::Unreachable);
            } else if (links_.contains(pair)) {
                result = swarm_detail::unexpected<ConnectError>(ConnectError::AlreadyConnected);
            } else if (pending_.contains(pair)) {
                result = swarm_detail::unexpected<ConnectError>(ConnectError::Busy);
            } else {
                pending_[pair] = from;
                emit(out, target, [from, announced](TransportEvents& s) {
                    s.on_connection_initiated(from, announced);
                });
            }
        }
        if (cb) cb(result);
        run(out);
    }

    void SimNetwork::answer(const EndpointId& from, const EndpointId& requester, bool accept) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto pair = make_pair(from, requester);
            const auto it = pending_.find(pair);
            // Only the requested side may answer.
            if (it == pending_.end() || it->second != requester) return;
            pending_.erase(it);

            const ConnectionStatus status = accept ? ConnectionStatus::Ok : ConnectionStatus::Rejected;
            if (accept) links_.insert(pair);
            emit(out, from, [requester, status](TransportEvents& s) { s.on_connection_result(requester, status); });
            emit(out, requester, [from, status](TransportEvents& s) { s.on_connection_result(from, status); });
        }
        run(out);
    }

    void SimNetwork::disconnect(const EndpointId& from, const EndpointId& peer) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto pair = make_pair(from, peer);
            if (links_.erase(pair) > 0) {
                emit(out, from, [peer](TransportEvents& s) { s.on_disconnected(peer); });
                emit(out, peer, [from](TransportEvents& s) { s.on_disconnected(from); });
            } else if (pending_.erase(pair) > 0) {
                emit(out, from, [peer](TransportEvents& s) { s.on_connection_result(peer, ConnectionStatus::Error); });
                emit(out, peer, [from](TransportEvents& s) { s.on_connection_result(from, ConnectionStatus::Error); });
            }
        }
        run(out);
    }

    void SimNetwork::set_discovering(const EndpointId& ep, bool on) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto me = nodes_.find(ep);
            if (me == nodes_.end()) return;
            me->second.discovering = on;
            if (on) {
                for (const auto& [other, n] : nodes_) {
                    if (other == ep || !n.advertising || !reachable(me->second, n)) continue;
                    emit(out, ep, [other, name = n.name](TransportEvents& s) { s.on_endpoint_found(other, name); });
                }
            }
        }
        run(out);
    }

    void SimNetwork::set_advertising(const EndpointId& ep, bool on) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto me = nodes_.find(ep);
            if (me == nodes_.end()) return;
            const bool was = me->second.advertising;
            me->second.advertising = on;
            if (on && !was) {
                for (const auto& [other, n] : nodes_) {
                    if (other == ep || !n.discovering || !reachable(n, me->second)) continue;
                    emit(out, other, [ep, name = me->second.name](TransportEvents& s) { s.on_endpoint_found(ep, name); });
                }
            }
        }
        run(out);
    }

    void SimNetwork::broadcast(const EndpointId& from, const Bytes& payload) {
        std::vector<Delivery> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (const auto& [a, b] : links_) {
                if (a != from && b != from) continue;
                const EndpointId peer = a == from ? b : a;
                emit(out, peer, [from, payload](TransportEvents& s) { s.on_payload_received(from, payload); });
            }
        }
        run(out);
    }

    // ------------------------------------------------------------------------
    // SimTransport
    // ------------------------------------------------------------------------

    void SimTransport::request_connection(const DeviceName& self, const EndpointId& target, ConnectCallback cb) {
        hub_->request(self_, self, target, std::move(cb));
    }

    void SimTransport::accept_connection(const EndpointId& endpoint) { hub_->answer(self_, endpoint, true); }

    void SimTransport::reject_connection(const EndpointId& endpoint) { hub_->answer(self_, endpoint, false); }

    void SimTransport::disconnect_from_endpoint(const EndpointId& endpoint) { hub_->disconnect(self_, endpoint); }

    void SimTransport::start_discovery() { hub_->set_discovering(self_, true); }

    void SimTransport::stop_discovery() { hub_->set_discovering(self_, false); }

    void SimTransport::start_advertising() { hub_->set_advertising(self_, true); }

    void SimTransport::stop_all() {
        hub_->set_discovering(self_, false);
        hub_->set_advertising(self_, false);
    }

    void SimTransport::broadcast(const Bytes& payload) { hub_->broadcast(self_, payload); }

    void SimTransport::set_event_sink(std::weak_ptr<TransportEvents> sink) {
        std::lock_guard<std::mutex> lk(sink_mu_);
        sink_ = std::move(sink);
    }

    std::shared_ptr<TransportEvents> SimTransport::sink() const {
        std::lock_guard<std::mutex> lk(sink_mu_);
        return sink_.lock();
    }

} // namespace swarm::transport
