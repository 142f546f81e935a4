#pragma once
/**
 * @file routed_message.hpp
 * @brief Flooded application message and its dedup identity.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "swarm/compat/expected.hpp"
#include "swarm/config/constants.hpp"
#include "swarm/wire/frame.hpp"

namespace swarm::wire {

    /** @struct MessageKey
     *  @brief Dedup identity. TTL is deliberately not part of it.
     */
    struct MessageKey {
        std::string message_id;
        std::string source_id;
        std::string dest_id;

        bool operator==(const MessageKey&) const = default;
    };

    struct MessageKeyHash {
        std::size_t operator()(const MessageKey& k) const noexcept;
    };

    /** @struct RoutedMessage
     *  @brief Envelope forwarded hop by hop until TTL runs out.
     */
    struct RoutedMessage {
        std::string message_id;                                   ///< Random 128-bit hex id
        std::string source_id;                                    ///< Originating device name
        std::string dest_id{config::constants::FLOOD_BROADCAST_DEST}; ///< Device name or BROADCAST
        int32_t     ttl{config::constants::FLOOD_DEFAULT_TTL};    ///< Remaining hops
        Bytes       payload;                                      ///< Application bytes

        [[nodiscard]] MessageKey key() const { return MessageKey{message_id, source_id, dest_id}; }
        [[nodiscard]] bool is_broadcast() const noexcept { return dest_id == config::constants::FLOOD_BROADCAST_DEST; }

        bool operator==(const RoutedMessage&) const = default;
    };

    /// Body of a ROUTED_MESSAGE frame.
    [[nodiscard]] Bytes encode_routed(const RoutedMessage& m);
    [[nodiscard]] swarm_detail::expected<RoutedMessage, CodecError> decode_routed(std::span<const uint8_t> buf);

    /// Complete ROUTED_MESSAGE frame for @p m.
    [[nodiscard]] Bytes routed_frame(const RoutedMessage& m);

} // namespace swarm::wire
