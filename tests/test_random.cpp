/**
 * @file test_random.cpp
 * @brief Tests for the random fill / churn strategy.
 *
 * Validates:
 *  - Churn fires with the configured probability at capacity
 *  - Never-failed candidates are preferred
 *  - Failed dials count a retry and land in ERROR
 *  - Late request answers after stop() leave the store alone
 *  - A peer that connects during backoff is not dialed
 *  - Backoff doubles from 2 s and caps at 32 s
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "swarm/state/mesh_state.hpp"
#include "swarm/topology/random_strategy.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using swarm::state::ConnectionPhase;
using swarm::state::MeshStateStore;
using swarm::topology::Admission;
using swarm::topology::CycleAction;
using swarm::topology::RandomStrategy;
using swarm::topology::RandomStrategyConfig;
using swarm::topology::StrategyContext;
using swarm::test::eventually;

namespace {

void add_peer(MeshStateStore& store, const std::string& name, ConnectionPhase phase = ConnectionPhase::Discovered) {
  (void)store.device_discovered("ep-" + name, name);
  if (phase != ConnectionPhase::Discovered) (void)store.update_phase("ep-" + name, phase);
}

/// Four CONNECTED peers: the node sits at capacity.
void fill_to_capacity(MeshStateStore& store) {
  for (const auto* n : {"p1", "p2", "p3", "p4"}) add_peer(store, n, ConnectionPhase::Connected);
}

int count_churns(RandomStrategy& strategy, int cycles) {
  int churns = 0;
  for (int i = 0; i < cycles; ++i) {
    if (strategy.run_cycle() == CycleAction::Churned) ++churns;
  }
  return churns;
}

} // namespace

// --------------------------- Churn ------------------------------------------

/**
 * @test Random_Churn_ScriptedTenPercent
 * @brief One draw in ten under p=0.1 churns exactly 100 of 1000 cycles.
 */
TEST(RandomStrategy, Random_Churn_ScriptedTenPercent) {
  MeshStateStore store("me");
  fill_to_capacity(store);
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;

  std::vector<double> units(10, 0.5);
  units[0] = 0.05;
  swarm::test::ScriptedRandom rng(units, {0});

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  EXPECT_EQ(count_churns(strategy, 1000), 100);
  EXPECT_EQ(transport.disconnects().size(), 100u);
  EXPECT_EQ(observer.count(swarm::obs::EventKind::Churned), 100u);
  EXPECT_TRUE(transport.requests().empty());
}

/**
 * @test Random_Churn_SeededWithinTolerance
 * @brief A seeded generator churns 100 +/- 5 times over 1000 cycles.
 */
TEST(RandomStrategy, Random_Churn_SeededWithinTolerance) {
  MeshStateStore store("me");
  fill_to_capacity(store);
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  swarm::util::SeededRandom rng(2024);

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  const int churns = count_churns(strategy, 1000);
  EXPECT_GE(churns, 95);
  EXPECT_LE(churns, 105);
}

/**
 * @test Random_Churn_NeverBelowCapacity
 * @brief Below capacity the loop fills instead of churning.
 */
TEST(RandomStrategy, Random_Churn_NeverBelowCapacity) {
  MeshStateStore store("me");
  add_peer(store, "p1", ConnectionPhase::Connected);
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng(std::vector<double>{0.0});

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  EXPECT_EQ(strategy.run_cycle(), CycleAction::Idle);
  EXPECT_TRUE(transport.disconnects().empty());
}

// --------------------------- Candidates -------------------------------------

/**
 * @test Random_PickCandidate_PrefersNeverFailed
 * @brief A peer with retries is only chosen when no fresh peer exists.
 */
TEST(RandomStrategy, Random_PickCandidate_PrefersNeverFailed) {
  MeshStateStore store("me");
  add_peer(store, "flaky");
  add_peer(store, "fresh");
  add_peer(store, "linked", ConnectionPhase::Connected);
  store.increment_retry("flaky");
  store.increment_retry("flaky");
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng({}, {0, 1, 2, 3});

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  for (int i = 0; i < 4; ++i) {
    const auto pick = strategy.pick_candidate();
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(pick->name, "fresh");
  }

  (void)store.update_phase("ep-fresh", ConnectionPhase::Connected);
  const auto fallback = strategy.pick_candidate();
  ASSERT_TRUE(fallback.has_value());
  EXPECT_EQ(fallback->name, "flaky");
}

// --------------------------- Dial outcomes ----------------------------------

/**
 * @test Random_Dial_Failure_CountsRetry
 * @brief A refused request moves the device to ERROR with one retry.
 */
TEST(RandomStrategy, Random_Dial_Failure_CountsRetry) {
  MeshStateStore store("me");
  add_peer(store, "x");
  swarm::test::FakeTransport transport;
  transport.set_responder([](const std::string&) {
    return swarm::transport::ConnectResult{swarm_detail::unexpected<swarm::transport::ConnectError>(
        swarm::transport::ConnectError::Unreachable)};
  });
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng({}, {0});

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  EXPECT_EQ(strategy.run_cycle(), CycleAction::Dialed);
  ASSERT_TRUE(eventually([&] { return strategy.dialer().pending_count() == 0; }));

  EXPECT_EQ(store.device("ep-x")->phase, ConnectionPhase::Error);
  EXPECT_EQ(store.retry_count("x"), 1);
  EXPECT_EQ(observer.count(swarm::obs::EventKind::ConnectFailed), 1u);
  EXPECT_TRUE(store.potential_peers().contains("ep-x"));
}

/**
 * @test Random_Dial_AlreadyConnected_IsSuccess
 * @brief "Already connected" reconciles the device to CONNECTED and clears retries.
 */
TEST(RandomStrategy, Random_Dial_AlreadyConnected_IsSuccess) {
  MeshStateStore store("me");
  add_peer(store, "x");
  swarm::test::FakeTransport transport;
  transport.set_responder([](const std::string&) {
    return swarm::transport::ConnectResult{swarm_detail::unexpected<swarm::transport::ConnectError>(
        swarm::transport::ConnectError::AlreadyConnected)};
  });
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng({}, {0});

  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, RandomStrategyConfig{});
  EXPECT_EQ(strategy.run_cycle(), CycleAction::Dialed);
  ASSERT_TRUE(eventually([&] { return strategy.dialer().pending_count() == 0; }));

  EXPECT_EQ(store.device("ep-x")->phase, ConnectionPhase::Connected);
  EXPECT_EQ(store.retry_count("x"), 0);
  EXPECT_TRUE(store.network_graph().at("me").contains("x"));
}

/**
 * @test Random_Dial_LateAnswerAfterStop_Ignored
 * @brief A request answered after the strategy is stopped and destroyed does
 *        not touch the store.
 */
TEST(RandomStrategy, Random_Dial_LateAnswerAfterStop_Ignored) {
  MeshStateStore store("me");
  add_peer(store, "x");
  swarm::test::FakeTransport transport;
  transport.set_deferred(true);
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng({}, {0});

  auto strategy = std::make_unique<RandomStrategy>(StrategyContext{store, transport, rng, observer, 4},
                                                   RandomStrategyConfig{});
  EXPECT_EQ(strategy->run_cycle(), CycleAction::Dialed);
  ASSERT_TRUE(eventually([&] { return transport.held_count() == 1; }));
  ASSERT_TRUE(eventually([&] { return strategy->dialer().pending_count() == 0; }));
  ASSERT_EQ(store.device("ep-x")->phase, ConnectionPhase::Connecting);

  strategy->stop();
  strategy.reset();
  const auto version = store.version();

  transport.answer_held(swarm::transport::ConnectResult{
      swarm_detail::unexpected<swarm::transport::ConnectError>(swarm::transport::ConnectError::Unreachable)});

  EXPECT_EQ(store.version(), version);
  EXPECT_EQ(store.device("ep-x")->phase, ConnectionPhase::Connecting);
  EXPECT_EQ(store.retry_count("x"), 0);
  EXPECT_EQ(observer.count(swarm::obs::EventKind::ConnectFailed), 0u);
}

/**
 * @test Random_Dial_ConnectedDuringBackoff_NotDialed
 * @brief A failed peer that connects while the dial backs off is left alone.
 */
TEST(RandomStrategy, Random_Dial_ConnectedDuringBackoff_NotDialed) {
  MeshStateStore store("me");
  add_peer(store, "x");
  store.increment_retry("x");
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng({}, {0});

  RandomStrategyConfig cfg;
  cfg.backoff_base_ms = 150; // retry 1 waits 300 ms
  RandomStrategy strategy(StrategyContext{store, transport, rng, observer, 4}, cfg);
  EXPECT_EQ(strategy.run_cycle(), CycleAction::Dialed);
  EXPECT_TRUE(strategy.dialer().is_pending("ep-x"));

  (void)store.update_phase("ep-x", ConnectionPhase::Connected);
  ASSERT_TRUE(eventually([&] { return strategy.dialer().pending_count() == 0; }));

  EXPECT_TRUE(transport.requests().empty());
  EXPECT_EQ(store.device("ep-x")->phase, ConnectionPhase::Connected);
  EXPECT_EQ(observer.count(swarm::obs::EventKind::ConnectRequested), 0u);
}

// --------------------------- Admission / backoff ----------------------------

/**
 * @test Random_Admit_CountsConnecting
 * @brief Admission counts CONNECTING slots, excluding the requester itself.
 */
TEST(RandomStrategy, Random_Admit_CountsConnecting) {
  MeshStateStore store("me");
  add_peer(store, "a", ConnectionPhase::Connected);
  add_peer(store, "b", ConnectionPhase::Connecting);
  (void)store.connection_initiated("ep-c", "c");
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  swarm::test::ScriptedRandom rng(std::vector<double>{0.5});

  RandomStrategy two(StrategyContext{store, transport, rng, observer, 2}, RandomStrategyConfig{});
  EXPECT_EQ(two.admit("ep-c", "c"), Admission::Reject);

  RandomStrategy three(StrategyContext{store, transport, rng, observer, 3}, RandomStrategyConfig{});
  EXPECT_EQ(three.admit("ep-c", "c"), Admission::Accept);
}

/**
 * @test Random_Backoff_DoublesAndCaps
 * @brief Retry r waits 2^min(r,5) seconds: 2 s up to 32 s, no jitter.
 */
TEST(RandomStrategy, Random_Backoff_DoublesAndCaps) {
  const auto policy = RandomStrategyConfig{}.backoff();
  swarm::test::ScriptedRandom rng({}, {999});

  EXPECT_EQ(policy.delay(0, rng), 0ms);
  EXPECT_EQ(policy.delay(1, rng), 2000ms);
  EXPECT_EQ(policy.delay(2, rng), 4000ms);
  EXPECT_EQ(policy.delay(3, rng), 8000ms);
  EXPECT_EQ(policy.delay(4, rng), 16000ms);
  EXPECT_EQ(policy.delay(5, rng), 32000ms);
  EXPECT_EQ(policy.delay(12, rng), 32000ms);
}
