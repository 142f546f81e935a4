/**
 * @file test_wire.cpp
 * @brief Tests for the CBOR frame, gossip and routed-message codecs.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "swarm/wire/frame.hpp"
#include "swarm/wire/routed_message.hpp"

using nlohmann::json;
using swarm::wire::CodecError;
using swarm::wire::FrameType;
using swarm::wire::RoutedMessage;

// --------------------------- Frames -----------------------------------------

/**
 * @test Frame_Garbage_IsMalformed
 * @brief Bytes that are not CBOR (or not a map) are rejected as malformed.
 */
TEST(Wire, Frame_Garbage_IsMalformed) {
  const std::vector<uint8_t> garbage{0xff, 0x00, 0x13};
  const auto r = swarm::wire::decode_frame(garbage);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), CodecError::Malformed);

  const auto array = json::to_cbor(json::array({1, 2, 3}));
  const auto a = swarm::wire::decode_frame(array);
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error(), CodecError::Malformed);

  const auto empty = swarm::wire::decode_frame(std::vector<uint8_t>{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), CodecError::Malformed);
}

/**
 * @test Frame_UnknownType_Reported
 * @brief A well-formed frame with an unknown discriminator is not guessed at.
 */
TEST(Wire, Frame_UnknownType_Reported) {
  json j;
  j["type"] = 7;
  j["payload"] = json::binary({1, 2});
  const auto r = swarm::wire::decode_frame(json::to_cbor(j));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), CodecError::UnknownType);
}

/**
 * @test Frame_MissingPayload_Reported
 * @brief Frames without a payload report the missing field.
 */
TEST(Wire, Frame_MissingPayload_Reported) {
  json j;
  j["type"] = 1;
  const auto r = swarm::wire::decode_frame(json::to_cbor(j));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), CodecError::MissingField);
}

/**
 * @test Frame_Payload_Preserved
 * @brief Type and payload bytes survive encoding.
 */
TEST(Wire, Frame_Payload_Preserved) {
  const swarm::wire::Frame f{FrameType::RoutedMessage, {0, 1, 2, 0xfe, 0xff}};
  const auto r = swarm::wire::decode_frame(swarm::wire::encode_frame(f));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->type, FrameType::RoutedMessage);
  EXPECT_EQ(r->payload, f.payload);
}

// --------------------------- Gossip body ------------------------------------

/**
 * @test Gossip_Body_Shape
 * @brief The body is `{"data": {name: [neighbors]}}` with sorted neighbor arrays.
 */
TEST(Wire, Gossip_Body_Shape) {
  const swarm::state::NetworkGraph g{{"b", {"c", "a"}}, {"lonely", {}}};
  const auto j = json::from_cbor(swarm::wire::encode_gossip(g));

  ASSERT_TRUE(j.contains("data"));
  EXPECT_EQ(j["data"]["b"], json::array({"a", "c"}));
  EXPECT_EQ(j["data"]["lonely"], json::array());

  const auto back = swarm::wire::decode_gossip(swarm::wire::encode_gossip(g));
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, g);
}

/**
 * @test Gossip_Body_WrongTypes_Malformed
 * @brief Non-array rows and non-string neighbors are rejected.
 */
TEST(Wire, Gossip_Body_WrongTypes_Malformed) {
  json row_not_array;
  row_not_array["data"]["a"] = "b";
  EXPECT_EQ(swarm::wire::decode_gossip(json::to_cbor(row_not_array)).error(), CodecError::Malformed);

  json number_neighbor;
  number_neighbor["data"]["a"] = json::array({1});
  EXPECT_EQ(swarm::wire::decode_gossip(json::to_cbor(number_neighbor)).error(), CodecError::Malformed);

  json no_data;
  no_data["graph"] = json::object();
  EXPECT_EQ(swarm::wire::decode_gossip(json::to_cbor(no_data)).error(), CodecError::MissingField);
}

// --------------------------- Routed messages --------------------------------

/**
 * @test Routed_Fields_Preserved
 * @brief Every field, including binary payload and a negative TTL, is kept.
 */
TEST(Wire, Routed_Fields_Preserved) {
  RoutedMessage m;
  m.message_id = "0123456789abcdef0123456789abcdef";
  m.source_id = "node-a";
  m.dest_id = "node-d";
  m.ttl = -3;
  m.payload = {0x00, 0x42, 0xff};

  const auto frame = swarm::wire::decode_frame(swarm::wire::routed_frame(m));
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->type, FrameType::RoutedMessage);

  const auto back = swarm::wire::decode_routed(frame->payload);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, m);
  EXPECT_FALSE(back->is_broadcast());
}

/**
 * @test Routed_Defaults_AreBroadcastTtl10
 * @brief A default message targets BROADCAST with ten hops.
 */
TEST(Wire, Routed_Defaults_AreBroadcastTtl10) {
  const RoutedMessage m;
  EXPECT_TRUE(m.is_broadcast());
  EXPECT_EQ(m.dest_id, "BROADCAST");
  EXPECT_EQ(m.ttl, 10);
}

/**
 * @test Routed_MissingOrWrongFields
 * @brief Absent keys are MissingField; a string TTL or out-of-range TTL is Malformed.
 */
TEST(Wire, Routed_MissingOrWrongFields) {
  json j;
  j["message_id"] = "m";
  j["source_id"] = "s";
  j["dest_id"] = "d";
  j["payload"] = json::binary({});
  EXPECT_EQ(swarm::wire::decode_routed(json::to_cbor(j)).error(), CodecError::MissingField);

  j["ttl"] = "ten";
  EXPECT_EQ(swarm::wire::decode_routed(json::to_cbor(j)).error(), CodecError::Malformed);

  j["ttl"] = int64_t{1} << 40;
  EXPECT_EQ(swarm::wire::decode_routed(json::to_cbor(j)).error(), CodecError::Malformed);

  j["ttl"] = 5;
  ASSERT_TRUE(swarm::wire::decode_routed(json::to_cbor(j)).has_value());
}
