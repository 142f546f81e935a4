/**
 * @file test_healing.cpp
 * @brief Tests for the discovery / advertising healing cycle.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

#include "swarm/healing/healing_service.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using swarm::healing::HealingConfig;
using swarm::healing::HealingService;

/**
 * @test Healing_Cycle_CallSequence
 * @brief One cycle scans, then stops everything and only advertises.
 */
TEST(HealingService, Healing_Cycle_CallSequence) {
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  HealingService healing(transport, observer, HealingConfig{10, 10});

  std::stop_source src;
  EXPECT_TRUE(healing.run_cycle(src.get_token()));
  EXPECT_EQ(transport.calls(), (std::vector<std::string>{"start_discovery", "stop_all", "start_advertising"}));
  EXPECT_EQ(healing.cycles(), 1u);
  EXPECT_EQ(observer.count(swarm::obs::EventKind::HealingCycle), 2u);
}

/**
 * @test Healing_Cycle_StopRequested
 * @brief A stopped token ends the cycle without touching the transport.
 */
TEST(HealingService, Healing_Cycle_StopRequested) {
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  HealingService healing(transport, observer, HealingConfig{10, 10});

  std::stop_source src;
  src.request_stop();
  EXPECT_FALSE(healing.run_cycle(src.get_token()));
  EXPECT_TRUE(transport.calls().empty());
  EXPECT_EQ(healing.cycles(), 0u);
}

/**
 * @test Healing_Loop_RepeatsUntilStopped
 * @brief The background loop keeps cycling and stops promptly.
 */
TEST(HealingService, Healing_Loop_RepeatsUntilStopped) {
  swarm::test::FakeTransport transport;
  swarm::test::RecordingObserver observer;
  HealingService healing(transport, observer, HealingConfig{5, 5});

  healing.start();
  EXPECT_TRUE(swarm::test::eventually([&] { return healing.cycles() >= 3; }));

  const auto t0 = std::chrono::steady_clock::now();
  healing.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
}
