/**
 * @file mesh_node.cpp
 * @brief Transport event dispatch and component lifecycle.
 */
#include "swarm/node/mesh_node.hpp"

#include <chrono>
#include <utility>

#include "swarm/obs/log.hpp"
#include "swarm/topology/strategy_factory.hpp"
#include "swarm/wire/frame.hpp"
#include "swarm/wire/routed_message.hpp"

namespace swarm::node {

using state::ConnectionPhase;
using transport::ConnectionStatus;

namespace {

std::shared_ptr<util::RandomSource> or_seeded(std::shared_ptr<util::RandomSource> rng) {
    if (rng) return rng;
    return std::make_shared<util::SeededRandom>(util::entropy_seed());
}

std::unique_ptr<obs::Observer> or_log(std::unique_ptr<obs::Observer> o, const std::string& name) {
    if (o) return o;
    return obs::make_log_observer(name);
}

std::string_view to_string(routing::FloodVerdict v) {
    switch (v) {
        case routing::FloodVerdict::Accepted:  return "accepted";
        case routing::FloodVerdict::Duplicate: return "duplicate";
        case routing::FloodVerdict::Expired:   return "ttl expired";
    }
    return "unknown";
}

} // namespace

std::shared_ptr<MeshNode> MeshNode::create(config::MeshConfig cfg, transport::Transport& transport,
                                           std::shared_ptr<util::RandomSource> rng,
                                           std::unique_ptr<obs::Observer> observer) {
    std::shared_ptr<MeshNode> node(new MeshNode(std::move(cfg), transport, std::move(rng), std::move(observer)));
    transport.set_event_sink(node);
    return node;
}

MeshNode::MeshNode(config::MeshConfig cfg, transport::Transport& transport,
                   std::shared_ptr<util::RandomSource> rng, std::unique_ptr<obs::Observer> observer)
    : cfg_(std::move(cfg)),
      transport_(transport),
      rng_(or_seeded(std::move(rng))),
      observer_(or_log(std::move(observer), cfg_.device_name)),
      store_(cfg_.device_name),
      strategy_(topology::make_strategy(
          cfg_.strategy,
          topology::StrategyContext{store_, transport_, *rng_, *observer_, cfg_.max_connections},
          cfg_.strategies)),
      gossip_(store_, transport_, *observer_, cfg_.gossip),
      healing_(transport_, *observer_, cfg_.healing),
      router_(cfg_.device_name, *rng_, cfg_.flood) {}

MeshNode::~MeshNode() { stop(); }

void MeshNode::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    obs::logger()->info("[{}] starting ({} strategy, max {} connections)",
                        cfg_.device_name, topology::to_string(cfg_.strategy), cfg_.max_connections);

    transport_.start_advertising();
    strategy_->start();
    gossip_.start();
    healing_.start();

    maintenance_.reopen();
    maintenance_.spawn([this](std::stop_token st) {
        while (sched::TaskGroup::sleep_for(st, std::chrono::milliseconds{cfg_.watchdog.sweep_period_ms})) {
            (void)run_maintenance();
        }
    });
}

void MeshNode::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    healing_.stop();
    gossip_.stop();
    strategy_->stop();
    maintenance_.stop();
    transport_.stop_all();
    obs::logger()->info("[{}] stopped", cfg_.device_name);
}

std::string MeshNode::send_message(const DeviceName& dest, wire::Bytes payload) {
    auto msg = router_.make_message(dest, std::move(payload));
    transport_.broadcast(wire::routed_frame(msg));
    return msg.message_id;
}

void MeshNode::set_message_handler(MessageHandler h) {
    std::lock_guard<std::mutex> lk(handler_mu_);
    handler_ = std::move(h);
}

std::size_t MeshNode::run_maintenance(std::chrono::steady_clock::time_point now) {
    const auto expired = store_.expire_stale(now, cfg_.watchdog.timeouts());
    if (expired > 0) {
        observer_->record({obs::EventKind::Expired, {}, std::to_string(expired) + " device(s)"});
        refresh_graph();
    }
    (void)router_.sweep(now);
    return expired;
}

// ----------------------------------------------------------------------------
// Transport events
// ----------------------------------------------------------------------------

void MeshNode::on_endpoint_found(const EndpointId& endpoint, const DeviceName& name) {
    if (name == cfg_.device_name) return;
    if (store_.device_discovered(endpoint, name)) {
        observer_->record({obs::EventKind::PeerDiscovered, name, endpoint});
    }
}

void MeshNode::on_endpoint_lost(const EndpointId& endpoint) {
    const auto d = store_.device(endpoint);
    if (!d) return;
    if (state::is_busy(d->phase)) {
        // Out of discovery range does not mean the link is gone.
        obs::logger()->debug("[{}] {} lost from discovery but still {}", cfg_.device_name, d->name,
                             state::to_string(d->phase));
        return;
    }
    if (store_.device_lost(endpoint)) observer_->record({obs::EventKind::PeerLost, d->name, endpoint});
}

void MeshNode::on_connection_initiated(const EndpointId& endpoint, const DeviceName& name) {
    (void)store_.connection_initiated(endpoint, name);

    const auto decision = running() ? strategy_->admit(endpoint, name) : topology::Admission::Reject;
    if (decision == topology::Admission::Accept) {
        observer_->record({obs::EventKind::InboundAccepted, name, endpoint});
        transport_.accept_connection(endpoint);
        return;
    }
    // Put it back in the pool first so the Rejected result is not counted as our failure.
    (void)store_.update_phase(endpoint, ConnectionPhase::Discovered);
    observer_->record({obs::EventKind::InboundRejected, name, "at capacity"});
    transport_.reject_connection(endpoint);
}

void MeshNode::on_connection_result(const EndpointId& endpoint, ConnectionStatus status) {
    const auto d = store_.device(endpoint);
    if (!d) return;

    const bool ok = status == ConnectionStatus::Ok;
    if (ok) {
        (void)store_.update_phase(endpoint, ConnectionPhase::Connected);
        store_.reset_retry(d->name);
        observer_->record({obs::EventKind::Connected, d->name, endpoint});
    } else if (d->phase == ConnectionPhase::Connecting) {
        store_.increment_retry(d->name);
        (void)store_.update_phase(endpoint, ConnectionPhase::Error);
        observer_->record({obs::EventKind::ConnectFailed, d->name,
                           status == ConnectionStatus::Rejected ? "rejected" : "error"});
    }
    strategy_->on_connection_result(endpoint, ok);
    refresh_graph();
}

void MeshNode::on_disconnected(const EndpointId& endpoint) {
    const auto d = store_.device(endpoint);
    if (!d) return;
    (void)store_.update_phase(endpoint, ConnectionPhase::Disconnected);
    observer_->record({obs::EventKind::Disconnected, d->name, endpoint});
    strategy_->on_disconnected(endpoint);
    refresh_graph();
}

void MeshNode::on_payload_received(const EndpointId& endpoint, const transport::Bytes& payload) {
    const auto frame = wire::decode_frame(payload);
    if (!frame) {
        obs::logger()->warn("[{}] dropping frame from {}: {}", cfg_.device_name, endpoint,
                            wire::to_string(frame.error()));
        return;
    }
    switch (frame->type) {
        case wire::FrameType::TopologyGossip: {
            const auto merged = gossip_.on_gossip(frame->payload);
            if (merged && *merged) {
                obs::logger()->debug("[{}] graph updated by gossip from {}", cfg_.device_name, endpoint);
            }
            break;
        }
        case wire::FrameType::RoutedMessage:
            handle_routed(frame->payload);
            break;
    }
}

void MeshNode::handle_routed(const transport::Bytes& body) {
    const auto msg = wire::decode_routed(body);
    if (!msg) {
        obs::logger()->warn("[{}] dropping routed message: {}", cfg_.device_name, wire::to_string(msg.error()));
        return;
    }

    const auto decision = router_.handle_incoming(*msg);
    if (decision.verdict != routing::FloodVerdict::Accepted) {
        observer_->record({obs::EventKind::MessageDropped, msg->source_id, std::string(to_string(decision.verdict))});
        return;
    }
    if (decision.deliver) {
        observer_->record({obs::EventKind::MessageDelivered, msg->source_id, msg->message_id});
        MessageHandler h;
        {
            std::lock_guard<std::mutex> lk(handler_mu_);
            h = handler_;
        }
        if (h) h(*msg);
    }
    if (decision.forward) {
        observer_->record({obs::EventKind::MessageForwarded, msg->source_id,
                           "ttl " + std::to_string(decision.forward->ttl)});
        transport_.broadcast(wire::routed_frame(*decision.forward));
    }
}

void MeshNode::refresh_graph() { (void)store_.refresh_local_neighbors(); }

} // namespace swarm::node
