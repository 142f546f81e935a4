#pragma once
/**
 * @file sim_network.hpp
 * @brief In-process medium connecting SimTransport instances.
 * @details Events are delivered synchronously on the calling thread and never
 *          while the hub lock is held, so handlers may call back into any
 *          transport. Great for deterministic tests and the mesh_sim demo.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "swarm/transport/transport.hpp"

namespace swarm::transport {

    class SimTransport;

    /**
     * @class SimNetwork
     * @brief Shared hub: endpoint registry, advertising/discovery flags, links.
     */
    class SimNetwork final : public std::enable_shared_from_this<SimNetwork> {
    public:
        /// Returns false if @p a and @p b must not see or reach each other.
        using LinkFilter = std::function<bool(const DeviceName& a, const DeviceName& b)>;

        static std::shared_ptr<SimNetwork> create();

        /// Register a device; its endpoint id is assigned by the hub ("ep-<n>").
        std::shared_ptr<SimTransport> attach(const DeviceName& name);

        /// Remove a device: peers see its links drop and the endpoint lost.
        void detach(const DeviceName& name);

        /// Install a reachability filter (nullptr = everyone reaches everyone).
        void set_link_filter(LinkFilter filter);

        /// Names linked to @p name.
        [[nodiscard]] std::set<DeviceName> links_of(const DeviceName& name) const;

        /// Number of established links.
        [[nodiscard]] std::size_t link_count() const;

        /// Endpoint id of @p name, empty if unknown.
        [[nodiscard]] EndpointId endpoint_of(const DeviceName& name) const;

    private:
        friend class SimTransport;

        struct Node {
            DeviceName name;
            std::weak_ptr<SimTransport> transport;
            bool advertising{false};
            bool discovering{false};
        };
        using Pair = std::pair<EndpointId, EndpointId>; ///< ordered (low, high)
        using Delivery = std::function<void()>;

        SimNetwork() = default;

        static Pair make_pair(const EndpointId& a, const EndpointId& b);
        bool reachable(const Node& a, const Node& b) const;
        /// Queue @p fn against @p ep's event sink. Caller holds mu_.
        void emit(std::vector<Delivery>& out, const EndpointId& ep,
                  std::function<void(TransportEvents&)> fn) const;
        static void run(std::vector<Delivery>& out);

        // Commands issued by SimTransport (from = caller endpoint).
        void request(const EndpointId& from, const DeviceName& announced, const EndpointId& target, ConnectCallback cb);
        void answer(const EndpointId& from, const EndpointId& requester, bool accept);
        void disconnect(const EndpointId& from, const EndpointId& peer);
        void set_discovering(const EndpointId& ep, bool on);
        void set_advertising(const EndpointId& ep, bool on);
        void broadcast(const EndpointId& from, const Bytes& payload);

        mutable std::mutex mu_;
        std::map<EndpointId, Node> nodes_;
        std::map<Pair, EndpointId> pending_; ///< pair -> requester
        std::set<Pair> links_;
        LinkFilter filter_;
        std::size_t next_id_{1};
    };

    /**
     * @class SimTransport
     * @brief Transport bound to one endpoint of a SimNetwork.
     */
    class SimTransport final : public Transport {
    public:
        SimTransport(std::shared_ptr<SimNetwork> hub, EndpointId self, DeviceName name)
            : hub_(std::move(hub)), self_(std::move(self)), name_(std::move(name)) {}

        void request_connection(const DeviceName& self, const EndpointId& target, ConnectCallback cb) override;
        void accept_connection(const EndpointId& endpoint) override;
        void reject_connection(const EndpointId& endpoint) override;
        void disconnect_from_endpoint(const EndpointId& endpoint) override;
        void start_discovery() override;
        void stop_discovery() override;
        void start_advertising() override;
        void stop_all() override;
        void broadcast(const Bytes& payload) override;
        void set_event_sink(std::weak_ptr<TransportEvents> sink) override;

        [[nodiscard]] const EndpointId& endpoint() const noexcept { return self_; }
        [[nodiscard]] const DeviceName& name() const noexcept { return name_; }

        /// Current sink, or nullptr if none is set or it expired.
        [[nodiscard]] std::shared_ptr<TransportEvents> sink() const;

    private:
        std::shared_ptr<SimNetwork> hub_;
        EndpointId self_;
        DeviceName name_;
        mutable std::mutex sink_mu_;
        std::weak_ptr<TransportEvents> sink_;
    };

} // namespace swarm::transport
