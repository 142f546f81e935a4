/**
 * @file routed_message.cpp
 * @brief CBOR codec for RoutedMessage.
 */
#include "swarm/wire/routed_message.hpp"

#include <functional>
#include <limits>

#include <nlohmann/json.hpp>

namespace swarm::wire {

    using json = nlohmann::json;
    using swarm_detail::unexpected;

    std::size_t MessageKeyHash::operator()(const MessageKey& k) const noexcept {
        const std::hash<std::string> h;
        std::size_t seed = h(k.message_id);
        // boost::hash_combine mixing
        seed ^= h(k.source_id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= h(k.dest_id)   + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }

    Bytes encode_routed(const RoutedMessage& m) {
        json j;
        j["message_id"] = m.message_id;
        j["source_id"]  = m.source_id;
        j["dest_id"]    = m.dest_id;
        j["ttl"]        = m.ttl;
        j["payload"]    = json::binary(m.payload);
        return json::to_cbor(j);
    }

    swarm_detail::expected<RoutedMessage, CodecError> decode_routed(std::span<const uint8_t> buf) {
        json j;
        try {
            j = json::from_cbor(buf.begin(), buf.end());
        } catch (const json::exception&) {
            return unexpected<CodecError>(CodecError::Malformed);
        }
        if (!j.is_object()) return unexpected<CodecError>(CodecError::Malformed);
        for (const char* key : {"message_id", "source_id", "dest_id", "ttl", "payload"}) {
            if (!j.contains(key)) return unexpected<CodecError>(CodecError::MissingField);
        }

        const auto& ttl = j["ttl"];
        if (!j["message_id"].is_string() || !j["source_id"].is_string() || !j["dest_id"].is_string() ||
            !ttl.is_number_integer() || !j["payload"].is_binary()) {
            return unexpected<CodecError>(CodecError::Malformed);
        }
        if (ttl.is_number_unsigned() && ttl.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            return unexpected<CodecError>(CodecError::Malformed);
        }
        const auto raw_ttl = ttl.get<int64_t>();
        if (raw_ttl < std::numeric_limits<int32_t>::min() || raw_ttl > std::numeric_limits<int32_t>::max()) {
            return unexpected<CodecError>(CodecError::Malformed);
        }

        RoutedMessage m;
        m.message_id = j["message_id"].get<std::string>();
        m.source_id  = j["source_id"].get<std::string>();
        m.dest_id    = j["dest_id"].get<std::string>();
        m.ttl        = static_cast<int32_t>(raw_ttl);
        const auto& bin = j["payload"].get_binary();
        m.payload.assign(bin.begin(), bin.end());
        return m;
    }

    Bytes routed_frame(const RoutedMessage& m) {
        return encode_frame(Frame{FrameType::RoutedMessage, encode_routed(m)});
    }

} // namespace swarm::wire
