#pragma once
/**
 * @file frame.hpp
 * @brief Typed envelope for everything sent over the transport, plus the gossip body.
 * @details Frames are CBOR documents `{"type": uint, "payload": bytes}`.
 *          Decoders never throw: malformed input comes back as a CodecError.
 */

#include <cstdint>
#include <span>
#include <string_view>

#include "swarm/compat/expected.hpp"
#include "swarm/state/network_graph.hpp"
#include "swarm/transport/transport.hpp"

namespace swarm::wire {

    using transport::Bytes;

    /// Frame discriminator. Values are part of the wire format.
    enum class FrameType : uint8_t {
        TopologyGossip = 1,
        RoutedMessage  = 2
    };

    /** @enum CodecError
     *  @brief Why a buffer could not be decoded.
     */
    enum class CodecError : uint8_t {
        Malformed,    ///< Not CBOR, or a field has the wrong type
        UnknownType,  ///< Frame type not understood by this build
        MissingField  ///< Required key absent
    };

    std::string_view to_string(CodecError e) noexcept;

    /** @struct Frame
     *  @brief Decoded envelope; @ref payload is the still-encoded body.
     */
    struct Frame {
        FrameType type{FrameType::TopologyGossip};
        Bytes     payload;
    };

    [[nodiscard]] Bytes encode_frame(const Frame& f);
    [[nodiscard]] swarm_detail::expected<Frame, CodecError> decode_frame(std::span<const uint8_t> buf);

    /// Gossip body: `{"data": {name: [neighbor, ...]}}`.
    [[nodiscard]] Bytes encode_gossip(const state::NetworkGraph& g);
    [[nodiscard]] swarm_detail::expected<state::NetworkGraph, CodecError> decode_gossip(std::span<const uint8_t> buf);

    /// Complete TOPOLOGY_GOSSIP frame for @p g.
    [[nodiscard]] Bytes gossip_frame(const state::NetworkGraph& g);

} // namespace swarm::wire
