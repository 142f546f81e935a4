#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: topology events + counters.
 * @details Backed by spdlog (see log.hpp). Components hold an Observer reference
 *          and never talk to the logging backend for decisions directly.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace swarm::obs {

    /// What happened to the overlay.
    enum class EventKind : uint8_t {
        PeerDiscovered,
        PeerLost,
        ConnectRequested,
        Connected,
        ConnectFailed,
        Disconnected,
        InboundAccepted,
        InboundRejected,
        Pruned,          ///< spare / redundant / leaf disconnect
        Churned,         ///< random island-breaker disconnect
        StabilityChanged,
        GossipSent,
        GossipMerged,
        HealingCycle,
        MessageDelivered,
        MessageForwarded,
        MessageDropped,
        Expired          ///< watchdog phase timeout
    };

    std::string_view to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Per-node counters for topology decisions.
     */
    struct Counters {
        uint64_t events{0};              ///< Total events recorded
        uint64_t connects_requested{0};  ///< Outbound dials issued
        uint64_t connects_failed{0};     ///< Dials that ended in ERROR
        uint64_t inbound_rejected{0};    ///< Inbound requests refused
        uint64_t disconnects_issued{0};  ///< Pruned + churned
        uint64_t gossip_merges{0};       ///< Gossip receipts that changed the graph
        uint64_t messages_delivered{0};  ///< Routed messages handed to the app
        uint64_t messages_dropped{0};    ///< Duplicates and expired TTLs
    };

    /** @struct TopologyEvent
     *  @brief Payload describing a single topology decision.
     */
    struct TopologyEvent {
        EventKind   kind{EventKind::PeerDiscovered};
        std::string peer;    ///< Device name or endpoint concerned (may be empty)
        std::string detail;  ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single topology event.
        virtual void record(const TopologyEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /**
     * @brief Observer that counts events and writes one log line per event.
     * @param node Device name prefixed to each line.
     * @param logger Backend logger; the shared "swarm" logger when null.
     */
    std::unique_ptr<Observer> make_log_observer(std::string node,
                                                std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace swarm::obs
