/**
 * @file frame.cpp
 * @brief CBOR frame and gossip codec (nlohmann::json).
 */
#include "swarm/wire/frame.hpp"

#include <nlohmann/json.hpp>

namespace swarm::wire {

    using json = nlohmann::json;
    using swarm_detail::unexpected;

    std::string_view to_string(CodecError e) noexcept {
        switch (e) {
            case CodecError::Malformed:    return "malformed";
            case CodecError::UnknownType:  return "unknown_type";
            case CodecError::MissingField: return "missing_field";
        }
        return "unknown";
    }

    Bytes encode_frame(const Frame& f) {
        json j;
        j["type"] = static_cast<uint8_t>(f.type);
        j["payload"] = json::binary(f.payload);
        return json::to_cbor(j);
    }

    swarm_detail::expected<Frame, CodecError> decode_frame(std::span<const uint8_t> buf) {
        json j;
        try {
            j = json::from_cbor(buf.begin(), buf.end());
        } catch (const json::exception&) {
            return unexpected<CodecError>(CodecError::Malformed);
        }
        if (!j.is_object()) return unexpected<CodecError>(CodecError::Malformed);
        if (!j.contains("type") || !j.contains("payload")) return unexpected<CodecError>(CodecError::MissingField);

        const auto& t = j["type"];
        const auto& p = j["payload"];
        if (!t.is_number_unsigned() || !p.is_binary()) return unexpected<CodecError>(CodecError::Malformed);

        Frame f;
        switch (t.get<uint64_t>()) {
            case static_cast<uint64_t>(FrameType::TopologyGossip): f.type = FrameType::TopologyGossip; break;
            case static_cast<uint64_t>(FrameType::RoutedMessage):  f.type = FrameType::RoutedMessage; break;
            default: return unexpected<CodecError>(CodecError::UnknownType);
        }
        const auto& bin = p.get_binary();
        f.payload.assign(bin.begin(), bin.end());
        return f;
    }

    Bytes encode_gossip(const state::NetworkGraph& g) {
        json data = json::object();
        for (const auto& [name, neighbors] : g) {
            data[name] = json(neighbors); // set<string> -> array
        }
        json j;
        j["data"] = std::move(data);
        return json::to_cbor(j);
    }

    swarm_detail::expected<state::NetworkGraph, CodecError> decode_gossip(std::span<const uint8_t> buf) {
        json j;
        try {
            j = json::from_cbor(buf.begin(), buf.end());
        } catch (const json::exception&) {
            return unexpected<CodecError>(CodecError::Malformed);
        }
        if (!j.is_object()) return unexpected<CodecError>(CodecError::Malformed);
        const auto it = j.find("data");
        if (it == j.end()) return unexpected<CodecError>(CodecError::MissingField);
        if (!it->is_object()) return unexpected<CodecError>(CodecError::Malformed);

        state::NetworkGraph g;
        for (const auto& [name, neighbors] : it->items()) {
            if (!neighbors.is_array()) return unexpected<CodecError>(CodecError::Malformed);
            auto& row = g[name];
            for (const auto& n : neighbors) {
                if (!n.is_string()) return unexpected<CodecError>(CodecError::Malformed);
                row.insert(n.get<std::string>());
            }
        }
        return g;
    }

    Bytes gossip_frame(const state::NetworkGraph& g) {
        return encode_frame(Frame{FrameType::TopologyGossip, encode_gossip(g)});
    }

} // namespace swarm::wire
