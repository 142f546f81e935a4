/**
 * @file test_base.cpp
 * @brief Tests for the base fill / triangle-breaking / rotation strategy.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "swarm/state/mesh_state.hpp"
#include "swarm/topology/base_strategy.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using swarm::state::ConnectionPhase;
using swarm::state::MeshStateStore;
using swarm::state::NetworkGraph;
using swarm::topology::Admission;
using swarm::topology::BaseStrategy;
using swarm::topology::BaseStrategyConfig;
using swarm::topology::StrategyContext;
using swarm::test::eventually;

namespace {

void add_peer(MeshStateStore& store, const std::string& name, ConnectionPhase phase = ConnectionPhase::Discovered) {
  (void)store.device_discovered("ep-" + name, name);
  if (phase != ConnectionPhase::Discovered) (void)store.update_phase("ep-" + name, phase);
}

/// Connected to w, x, y, z; gossip says x and y are linked to each other.
void triangle_at_capacity(MeshStateStore& store) {
  for (const auto* n : {"w", "x", "y", "z"}) add_peer(store, n, ConnectionPhase::Connected);
  (void)store.refresh_local_neighbors();
  (void)store.merge_graph(NetworkGraph{{"x", {"me", "y"}}, {"y", {"me", "x"}}});
}

struct BaseRig {
  StrategyContext ctx(uint32_t max = 4) { return StrategyContext{store, transport, rng, observer, max}; }

  MeshStateStore store{"me"};
  swarm::test::FakeTransport transport;
  swarm::test::ScriptedRandom rng{std::vector<double>{}, std::vector<uint64_t>{0}};
  swarm::test::RecordingObserver observer;
};

} // namespace

// --------------------------- Fill -------------------------------------------

/**
 * @test Base_Manage_PrefersNovelPeer
 * @brief A peer absent from the gossiped graph is dialed before a known one.
 */
TEST(BaseStrategy, Base_Manage_PrefersNovelPeer) {
  BaseRig rig;
  add_peer(rig.store, "a");
  add_peer(rig.store, "n");
  (void)rig.store.merge_graph(NetworkGraph{{"a", {"b"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  const auto target = base.manage_connections();
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->name, "n");

  ASSERT_TRUE(eventually([&] { return base.dialer().pending_count() == 0; }));
  EXPECT_EQ(rig.transport.requests(), (std::vector<std::string>{"ep-n"}));
}

/**
 * @test Base_Manage_FallsBackToKnownPeer
 * @brief Without a novel peer the first available one is dialed.
 */
TEST(BaseStrategy, Base_Manage_FallsBackToKnownPeer) {
  BaseRig rig;
  add_peer(rig.store, "a");
  (void)rig.store.merge_graph(NetworkGraph{{"a", {"b"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  const auto target = base.manage_connections();
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->name, "a");
}

/**
 * @test Base_Manage_EmptyPool_Idle
 * @brief Nothing to dial, nothing happens.
 */
TEST(BaseStrategy, Base_Manage_EmptyPool_Idle) {
  BaseRig rig;
  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_FALSE(base.manage_connections().has_value());
  EXPECT_TRUE(rig.transport.calls().empty());
}

// --------------------------- Triangle breaking ------------------------------

/**
 * @test Base_Redundant_DropsTriangleEdge
 * @brief Two neighbors linked to each other: one of them is disconnected.
 */
TEST(BaseStrategy, Base_Redundant_DropsTriangleEdge) {
  BaseRig rig;
  triangle_at_capacity(rig.store);

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_TRUE(base.try_disconnect_redundant_peer("newcomer"));
  EXPECT_EQ(rig.transport.disconnects(), (std::vector<std::string>{"ep-x"}));
  EXPECT_EQ(rig.observer.count(swarm::obs::EventKind::Pruned), 1u);
}

/**
 * @test Base_Redundant_NoTriangle_KeepsLinks
 * @brief Without a linked pair of neighbors nothing is dropped.
 */
TEST(BaseStrategy, Base_Redundant_NoTriangle_KeepsLinks) {
  BaseRig rig;
  for (const auto* n : {"w", "x", "y", "z"}) add_peer(rig.store, n, ConnectionPhase::Connected);
  (void)rig.store.refresh_local_neighbors();
  (void)rig.store.merge_graph(NetworkGraph{{"x", {"me", "q"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_FALSE(base.try_disconnect_redundant_peer("newcomer"));
  EXPECT_TRUE(rig.transport.disconnects().empty());
}

/**
 * @test Base_Manage_AtCapacity_MakesRoomForNovel
 * @brief Full with a novel peer waiting: a triangle edge is broken, nothing is dialed yet.
 */
TEST(BaseStrategy, Base_Manage_AtCapacity_MakesRoomForNovel) {
  BaseRig rig;
  triangle_at_capacity(rig.store);
  add_peer(rig.store, "novel");

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_FALSE(base.manage_connections().has_value());
  EXPECT_EQ(rig.transport.disconnects(), (std::vector<std::string>{"ep-x"}));
  EXPECT_TRUE(rig.transport.requests().empty());
}

// --------------------------- Admission --------------------------------------

/**
 * @test Base_Admit_BelowCapacity_Accepts
 * @brief Room left: accept without touching existing links.
 */
TEST(BaseStrategy, Base_Admit_BelowCapacity_Accepts) {
  BaseRig rig;
  add_peer(rig.store, "a", ConnectionPhase::Connected);
  (void)rig.store.connection_initiated("ep-b", "b");

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_EQ(base.admit("ep-b", "b"), Admission::Accept);
  EXPECT_TRUE(rig.transport.disconnects().empty());
}

/**
 * @test Base_Admit_AtCapacity_TriangleOrReject
 * @brief Full: accept only if a redundant link could be dropped.
 */
TEST(BaseStrategy, Base_Admit_AtCapacity_TriangleOrReject) {
  {
    BaseRig rig;
    triangle_at_capacity(rig.store);
    (void)rig.store.connection_initiated("ep-v", "v");
    BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
    EXPECT_EQ(base.admit("ep-v", "v"), Admission::Accept);
    EXPECT_EQ(rig.transport.disconnects().size(), 1u);
  }
  {
    BaseRig rig;
    for (const auto* n : {"w", "x", "y", "z"}) add_peer(rig.store, n, ConnectionPhase::Connected);
    (void)rig.store.refresh_local_neighbors();
    (void)rig.store.connection_initiated("ep-v", "v");
    BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
    EXPECT_EQ(base.admit("ep-v", "v"), Admission::Reject);
    EXPECT_TRUE(rig.transport.disconnects().empty());
  }
}

// --------------------------- Rotation ---------------------------------------

/**
 * @test Base_Rotation_DropsLeaf
 * @brief At capacity a neighbor whose only link is us gets rotated out.
 */
TEST(BaseStrategy, Base_Rotation_DropsLeaf) {
  BaseRig rig;
  for (const auto* n : {"a", "b", "c", "d"}) add_peer(rig.store, n, ConnectionPhase::Connected);
  (void)rig.store.refresh_local_neighbors();
  (void)rig.store.merge_graph(NetworkGraph{
      {"a", {"me"}}, {"b", {"me", "c"}}, {"c", {"me", "b"}}, {"d", {"me", "q"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  const auto dropped = base.connection_rotation();
  ASSERT_TRUE(dropped.has_value());
  EXPECT_EQ(*dropped, "a");
  EXPECT_EQ(rig.transport.disconnects(), (std::vector<std::string>{"ep-a"}));
}

/**
 * @test Base_Rotation_SingleForeignEdge_NotLeaf
 * @brief A neighbor whose only known edge points elsewhere is not a leaf.
 */
TEST(BaseStrategy, Base_Rotation_SingleForeignEdge_NotLeaf) {
  BaseRig rig;
  for (const auto* n : {"a", "b", "c", "d"}) add_peer(rig.store, n, ConnectionPhase::Connected);
  (void)rig.store.refresh_local_neighbors();
  (void)rig.store.merge_graph(NetworkGraph{
      {"a", {"q"}}, {"b", {"me", "c"}}, {"c", {"me", "b"}}, {"d", {"me"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  const auto dropped = base.connection_rotation();
  ASSERT_TRUE(dropped.has_value());
  EXPECT_EQ(*dropped, "d");
  EXPECT_EQ(rig.transport.disconnects(), (std::vector<std::string>{"ep-d"}));
}

/**
 * @test Base_Rotation_BelowCapacity_Idle
 * @brief Rotation only runs when every slot is taken.
 */
TEST(BaseStrategy, Base_Rotation_BelowCapacity_Idle) {
  BaseRig rig;
  add_peer(rig.store, "a", ConnectionPhase::Connected);
  (void)rig.store.refresh_local_neighbors();
  (void)rig.store.merge_graph(NetworkGraph{{"a", {"me"}}});

  BaseStrategy base(rig.ctx(), BaseStrategyConfig{});
  EXPECT_FALSE(base.connection_rotation().has_value());
}
