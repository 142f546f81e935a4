/**
 * @file test_obs.cpp
 * @brief Tests for the spdlog-backed observer and log-level handling.
 */

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "swarm/obs/log.hpp"
#include "swarm/obs/observability.hpp"

using swarm::obs::EventKind;

/**
 * @test Obs_LogObserver_CountsAndLogs
 * @brief Decisions bump their counters and produce one log line each.
 */
TEST(Observability, Obs_LogObserver_CountsAndLogs) {
  std::ostringstream out;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto lg = std::make_shared<spdlog::logger>("obs_test", sink);
  lg->set_level(spdlog::level::trace);
  lg->set_pattern("%l %v");

  auto observer = swarm::obs::make_log_observer("node-1", lg);
  observer->record({EventKind::ConnectRequested, "peer-2", "ring"});
  observer->record({EventKind::ConnectFailed, "peer-2", "unreachable"});
  observer->record({EventKind::Pruned, "peer-3", "ring spare"});
  observer->record({EventKind::Churned, "peer-4", "island breaker"});
  observer->record({EventKind::MessageDelivered, "peer-5", "id"});
  lg->flush();

  const auto c = observer->snapshot();
  EXPECT_EQ(c.events, 5u);
  EXPECT_EQ(c.connects_requested, 1u);
  EXPECT_EQ(c.connects_failed, 1u);
  EXPECT_EQ(c.disconnects_issued, 2u);
  EXPECT_EQ(c.messages_delivered, 1u);
  EXPECT_EQ(c.gossip_merges, 0u);

  const auto text = out.str();
  EXPECT_NE(text.find("warning [node-1] connect_failed peer=peer-2 unreachable"), std::string::npos) << text;
  EXPECT_NE(text.find("info [node-1] pruned peer=peer-3 ring spare"), std::string::npos) << text;
}

/**
 * @test Obs_EventKind_Names
 * @brief Every event kind has a stable snake_case name.
 */
TEST(Observability, Obs_EventKind_Names) {
  EXPECT_EQ(swarm::obs::to_string(EventKind::PeerDiscovered), "peer_discovered");
  EXPECT_EQ(swarm::obs::to_string(EventKind::StabilityChanged), "stability_changed");
  EXPECT_EQ(swarm::obs::to_string(EventKind::Expired), "expired");
}

/**
 * @test Obs_Levels_Validated
 * @brief Only spdlog level names are accepted.
 */
TEST(Observability, Obs_Levels_Validated) {
  EXPECT_TRUE(swarm::obs::is_valid_level("debug"));
  EXPECT_TRUE(swarm::obs::is_valid_level("off"));
  EXPECT_FALSE(swarm::obs::is_valid_level("loud"));

  EXPECT_TRUE(swarm::obs::set_level("warn"));
  EXPECT_EQ(swarm::obs::logger()->level(), spdlog::level::warn);
  EXPECT_FALSE(swarm::obs::set_level("shout"));
  EXPECT_EQ(swarm::obs::logger()->level(), spdlog::level::warn);
  EXPECT_TRUE(swarm::obs::set_level("info"));
}
