// =============================================================================
// command_handler_test.cpp
// =============================================================================
// Unit tests for the operator command protocol (executeCommand).
//
// Validates:
//   - PING / STATUS replies and the status document layout
//   - PAUSE / RESUME / CLOSE_ALL are queued for the next cycle
//   - RESET_KILL_SWITCH returns the engine to IDLE
//   - SET_WEIGHT / ENABLE / DISABLE argument handling
//   - Unknown and malformed commands produce error replies
// =============================================================================

#include "autotrader/engine/command_handler.hpp"

#include "engine_rig.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using autotrader::executeCommand;
using autotrader::domain::Direction;
using autotrader::testing::EngineRig;
using nlohmann::json;

class CommandHandlerTest : public ::testing::Test {
 protected:
  json send(const std::string& command) {
    return json::parse(executeCommand(rig.orchestrator, command));
  }

  EngineRig rig;
};

TEST_F(CommandHandlerTest, Ping) {
  auto r = send("PING");
  EXPECT_EQ(r.at("status"), "ok");
  EXPECT_EQ(r.at("response"), "PONG");
}

// -----------------------------------------------------------------------------
// 1. STATUS carries engine, risk, positions and strategy registry.
// -----------------------------------------------------------------------------
TEST_F(CommandHandlerTest, StatusDocument) {
  rig.module->set(Direction::Buy, 90.0);
  rig.cycleAt(50000.0);

  auto r = send("STATUS");

  EXPECT_EQ(r.at("status"), "ok");
  EXPECT_EQ(r.at("symbol"), "BTC/USDT");
  EXPECT_EQ(r.at("state"), "IDLE");
  EXPECT_EQ(r.at("paused"), false);
  EXPECT_EQ(r.at("cycle_count"), 1);
  EXPECT_NEAR(r.at("balance").get<double>(), 9500.0, 1e-9);
  EXPECT_EQ(r.at("risk").at("locked"), false);
  ASSERT_EQ(r.at("positions").size(), 1u);
  EXPECT_EQ(r.at("positions")[0].at("symbol"), "BTC/USDT");
  ASSERT_EQ(r.at("strategies").size(), 1u);
  EXPECT_EQ(r.at("strategies")[0].at("name"), "fake");
  EXPECT_EQ(r.at("strategies")[0].at("enabled"), true);
}

// -----------------------------------------------------------------------------
// 2. PAUSE is acknowledged now and applied at the next cycle.
// -----------------------------------------------------------------------------
TEST_F(CommandHandlerTest, PauseAndResume) {
  auto r = send("PAUSE");
  EXPECT_EQ(r.at("status"), "ok");
  EXPECT_FALSE(rig.orchestrator.paused());

  rig.cycleAt(50000.0);
  EXPECT_TRUE(rig.orchestrator.paused());

  send("RESUME");
  rig.cycleAt(50000.0);
  EXPECT_FALSE(rig.orchestrator.paused());
}

TEST_F(CommandHandlerTest, CloseAll) {
  rig.module->set(Direction::Buy, 90.0);
  rig.cycleAt(50000.0);
  rig.module->set(Direction::Hold, 0.0);

  EXPECT_EQ(send("CLOSE_ALL").at("status"), "ok");
  rig.cycleAt(50000.0);

  EXPECT_TRUE(rig.ledger.openPositions().empty());
}

TEST_F(CommandHandlerTest, ResetKillSwitch) {
  rig.risk.checkKillSwitch(99.0);

  auto r = send("RESET_KILL_SWITCH");

  EXPECT_EQ(r.at("status"), "ok");
  EXPECT_EQ(r.at("state"), "IDLE");
  EXPECT_FALSE(rig.risk.locked());
}

// -----------------------------------------------------------------------------
// 3. Strategy registry commands.
// -----------------------------------------------------------------------------
TEST_F(CommandHandlerTest, SetWeight) {
  EXPECT_EQ(send("SET_WEIGHT fake 0.25").at("status"), "ok");
  EXPECT_DOUBLE_EQ(rig.aggregator.sources()[0].weight, 0.25);

  auto unknown = send("SET_WEIGHT other 0.5");
  EXPECT_EQ(unknown.at("status"), "error");
  EXPECT_EQ(unknown.at("message"), "unknown strategy 'other'");

  EXPECT_EQ(send("SET_WEIGHT fake 2").at("status"), "error");
  EXPECT_EQ(send("SET_WEIGHT fake abc").at("status"), "error");
  EXPECT_EQ(send("SET_WEIGHT fake 0.5x").at("status"), "error");
  EXPECT_EQ(send("SET_WEIGHT fake").at("status"), "error");
  EXPECT_DOUBLE_EQ(rig.aggregator.sources()[0].weight, 0.25);
}

TEST_F(CommandHandlerTest, EnableDisable) {
  EXPECT_EQ(send("DISABLE fake").at("status"), "ok");
  EXPECT_FALSE(rig.aggregator.sources()[0].enabled);

  EXPECT_EQ(send("ENABLE fake").at("status"), "ok");
  EXPECT_TRUE(rig.aggregator.sources()[0].enabled);

  EXPECT_EQ(send("ENABLE nobody").at("status"), "error");
  EXPECT_EQ(send("DISABLE").at("status"), "error");
}

TEST_F(CommandHandlerTest, UnknownAndEmptyCommands) {
  auto r = send("LAUNCH_ROCKET");
  EXPECT_EQ(r.at("status"), "error");
  EXPECT_EQ(r.at("message"), "unknown command 'LAUNCH_ROCKET'");

  EXPECT_EQ(send("").at("message"), "empty command");
  EXPECT_EQ(send("   ").at("message"), "empty command");
}

TEST_F(CommandHandlerTest, StopRequestsLoopExit) {
  EXPECT_EQ(send("STOP").at("status"), "ok");

  // A stop that arrives before run() ends it immediately.
  rig.orchestrator.run();
  EXPECT_EQ(rig.orchestrator.state(), autotrader::domain::EngineState::Idle);
  EXPECT_EQ(rig.market.calls, 0);
}
