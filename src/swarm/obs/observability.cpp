/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "swarm/obs/observability.hpp"
#include "swarm/obs/log.hpp"

#include <mutex>
#include <utility>

namespace swarm::obs {

    std::string_view to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::PeerDiscovered:   return "peer_discovered";
            case EventKind::PeerLost:         return "peer_lost";
            case EventKind::ConnectRequested: return "connect_requested";
            case EventKind::Connected:        return "connected";
            case EventKind::ConnectFailed:    return "connect_failed";
            case EventKind::Disconnected:     return "disconnected";
            case EventKind::InboundAccepted:  return "inbound_accepted";
            case EventKind::InboundRejected:  return "inbound_rejected";
            case EventKind::Pruned:           return "pruned";
            case EventKind::Churned:          return "churned";
            case EventKind::StabilityChanged: return "stability_changed";
            case EventKind::GossipSent:       return "gossip_sent";
            case EventKind::GossipMerged:     return "gossip_merged";
            case EventKind::HealingCycle:     return "healing_cycle";
            case EventKind::MessageDelivered: return "message_delivered";
            case EventKind::MessageForwarded: return "message_forwarded";
            case EventKind::MessageDropped:   return "message_dropped";
            case EventKind::Expired:          return "expired";
        }
        return "unknown";
    }

    namespace {

    spdlog::level::level_enum level_for(EventKind k) {
        switch (k) {
            case EventKind::ConnectFailed:
            case EventKind::InboundRejected:
                return spdlog::level::warn;
            case EventKind::GossipSent:
            case EventKind::MessageForwarded:
            case EventKind::MessageDropped:
            case EventKind::PeerDiscovered:
                return spdlog::level::debug;
            default:
                return spdlog::level::info;
        }
    }

    } // namespace

    class LogObserver : public Observer {
    public:
        LogObserver(std::string node, std::shared_ptr<spdlog::logger> lg)
            : node_(std::move(node)), log_(std::move(lg)) {}

        void record(const TopologyEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.events++;
                switch (e.kind) {
                    case EventKind::ConnectRequested: ctr_.connects_requested++; break;
                    case EventKind::ConnectFailed:    ctr_.connects_failed++; break;
                    case EventKind::InboundRejected:  ctr_.inbound_rejected++; break;
                    case EventKind::Pruned:
                    case EventKind::Churned:          ctr_.disconnects_issued++; break;
                    case EventKind::GossipMerged:     ctr_.gossip_merges++; break;
                    case EventKind::MessageDelivered: ctr_.messages_delivered++; break;
                    case EventKind::MessageDropped:   ctr_.messages_dropped++; break;
                    default: break;
                }
            }
            log_->log(level_for(e.kind), "[{}] {} peer={} {}", node_, to_string(e.kind), e.peer, e.detail);
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }

    private:
        std::string node_;
        std::shared_ptr<spdlog::logger> log_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::unique_ptr<Observer> make_log_observer(std::string node, std::shared_ptr<spdlog::logger> lg) {
        if (!lg) lg = logger();
        return std::make_unique<LogObserver>(std::move(node), std::move(lg));
    }

} // namespace swarm::obs
