#pragma once
/**
 * @file transport.hpp
 * @brief Pluggable point-to-point transport the topology engine drives.
 * @details The engine only issues commands and consumes lifecycle events; the
 *          physical medium and its handshake are behind this interface.
 *          An in-process simulator (sim_network.hpp) implements it for tests.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "swarm/compat/expected.hpp"
#include "swarm/state/device_state.hpp"

namespace swarm::transport {

    using state::DeviceName;
    using state::EndpointId;

    /// Opaque payload bytes.
    using Bytes = std::vector<std::uint8_t>;

    /** @enum ConnectError
     *  @brief Why a connection request failed. AlreadyConnected is a race, not a failure.
     */
    enum class ConnectError : uint8_t {
        AlreadyConnected, ///< A link to the endpoint already exists
        Busy,             ///< A request for the same pair is in flight
        Unreachable,      ///< Endpoint unknown or out of range
        NotRunning        ///< Transport stopped
    };

    std::string_view to_string(ConnectError e) noexcept;

    /// Outcome of the handshake, reported to both ends.
    enum class ConnectionStatus : uint8_t { Ok, Rejected, Error };

    using ConnectResult   = swarm_detail::expected<void, ConnectError>;
    using ConnectCallback = std::function<void(ConnectResult)>;

    /** @class TransportEvents
     *  @brief Lifecycle callbacks delivered by a Transport.
     *  @note Callbacks may run on any thread, including inside a Transport call.
     */
    class TransportEvents {
    public:
        virtual ~TransportEvents() = default;

        virtual void on_endpoint_found(const EndpointId& endpoint, const DeviceName& name) = 0;
        virtual void on_endpoint_lost(const EndpointId& endpoint) = 0;
        /// Inbound request; answer with accept_connection / reject_connection.
        virtual void on_connection_initiated(const EndpointId& endpoint, const DeviceName& name) = 0;
        virtual void on_connection_result(const EndpointId& endpoint, ConnectionStatus status) = 0;
        virtual void on_disconnected(const EndpointId& endpoint) = 0;
        virtual void on_payload_received(const EndpointId& endpoint, const Bytes& payload) = 0;
    };

    /** @class Transport
     *  @brief Commands the engine issues to the medium.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Ask @p target for a connection, announcing @p self.
         * @param cb Invoked once with the request outcome; the handshake result
         *           arrives later through TransportEvents::on_connection_result.
         */
        virtual void request_connection(const DeviceName& self, const EndpointId& target, ConnectCallback cb) = 0;

        virtual void accept_connection(const EndpointId& endpoint) = 0;
        virtual void reject_connection(const EndpointId& endpoint) = 0;
        virtual void disconnect_from_endpoint(const EndpointId& endpoint) = 0;

        virtual void start_discovery() = 0;
        virtual void stop_discovery() = 0;
        virtual void start_advertising() = 0;
        /// Stop discovery and advertising. Established links are kept.
        virtual void stop_all() = 0;

        /// Send @p payload to every connected endpoint.
        virtual void broadcast(const Bytes& payload) = 0;

        /// Where lifecycle events go. Held weakly; expired sinks are skipped.
        virtual void set_event_sink(std::weak_ptr<TransportEvents> sink) = 0;
    };

} // namespace swarm::transport
