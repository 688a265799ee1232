// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for configuration loading.
//
// Validates:
//   - Defaults when keys are absent
//   - Section parsing and unit conversion (seconds -> ms)
//   - Range validation and type errors raise ConfigError
//   - Environment overrides for paper trading and venue
// =============================================================================

#include "autotrader/config/engine_config.hpp"
#include "autotrader/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

using autotrader::ConfigError;
using autotrader::EngineConfig;
using autotrader::parseEngineConfig;
using nlohmann::json;

// =============================================================================
// Test fixture: keeps the override variables out of the environment.
// =============================================================================
class EngineConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearEnv(); }
  void TearDown() override { clearEnv(); }

  static void clearEnv() {
    unsetenv("AUTOTRADER_PAPER_TRADING");
    unsetenv("AUTOTRADER_VENUE");
  }
};

TEST_F(EngineConfigTest, EmptyDocumentGivesDefaults) {
  EngineConfig c = parseEngineConfig(json::object());

  EXPECT_EQ(c.symbol, "BTC/USDT");
  EXPECT_EQ(c.poll_interval_ms, 300'000);
  EXPECT_DOUBLE_EQ(c.confidence_threshold, 70.0);
  EXPECT_DOUBLE_EQ(c.risk.position_size_percent, 5.0);
  EXPECT_DOUBLE_EQ(c.risk.daily_loss_limit_percent, 15.0);
  EXPECT_DOUBLE_EQ(c.risk.kill_switch_percent, 50.0);
  EXPECT_DOUBLE_EQ(c.risk.starting_capital, 10000.0);
  EXPECT_DOUBLE_EQ(c.risk.stop_loss_percent, 5.0);
  EXPECT_TRUE(c.paper_trading);
  EXPECT_EQ(c.venue, "okx");
  EXPECT_TRUE(c.strategies.empty());
}

// -----------------------------------------------------------------------------
// 1. Every section is read; seconds become milliseconds.
// -----------------------------------------------------------------------------
TEST_F(EngineConfigTest, ParsesAllSections) {
  json doc = {
      {"symbol", "ETH/USDT"},
      {"poll_interval_seconds", 60},
      {"error_backoff_seconds", 5.5},
      {"confidence_threshold", 65},
      {"risk", {{"position_size_percent", 2}, {"starting_capital", 2500}}},
      {"execution", {{"paper_trading", false}, {"venue", "binance"}}},
      {"market_data", {{"series_capacity", 50}, {"max_tick_age_seconds", 120}}},
      {"control", {{"command_endpoint", "tcp://127.0.0.1:7000"}}},
      {"persistence", {{"data_dir", "/var/lib/autotrader"}}},
      {"strategies",
       {{"moving_average_cross",
         {{"weight", 0.6},
          {"enabled", false},
          {"params", {{"short_window", 5}, {"long_window", 20}}}}}}},
  };

  EngineConfig c = parseEngineConfig(doc);

  EXPECT_EQ(c.symbol, "ETH/USDT");
  EXPECT_EQ(c.poll_interval_ms, 60'000);
  EXPECT_EQ(c.error_backoff_ms, 5'500);
  EXPECT_DOUBLE_EQ(c.confidence_threshold, 65.0);
  EXPECT_DOUBLE_EQ(c.risk.position_size_percent, 2.0);
  EXPECT_DOUBLE_EQ(c.risk.starting_capital, 2500.0);
  EXPECT_DOUBLE_EQ(c.risk.kill_switch_percent, 50.0);
  EXPECT_FALSE(c.paper_trading);
  EXPECT_EQ(c.venue, "binance");
  EXPECT_EQ(c.series_capacity, 50u);
  EXPECT_EQ(c.max_tick_age_ms, 120'000);
  EXPECT_EQ(c.command_endpoint, "tcp://127.0.0.1:7000");
  EXPECT_EQ(c.data_dir, "/var/lib/autotrader");

  ASSERT_EQ(c.strategies.count("moving_average_cross"), 1u);
  const auto& sc = c.strategies.at("moving_average_cross");
  EXPECT_DOUBLE_EQ(sc.weight, 0.6);
  EXPECT_FALSE(sc.enabled);
  EXPECT_DOUBLE_EQ(sc.params.at("long_window"), 20.0);
}

// -----------------------------------------------------------------------------
// 2. Out-of-range values are refused before the engine starts.
// -----------------------------------------------------------------------------
TEST_F(EngineConfigTest, RejectsOutOfRangeValues) {
  EXPECT_THROW(parseEngineConfig({{"risk", {{"position_size_percent", 0}}}}),
               ConfigError);
  EXPECT_THROW(parseEngineConfig({{"risk", {{"kill_switch_percent", 150}}}}),
               ConfigError);
  EXPECT_THROW(parseEngineConfig({{"risk", {{"stop_loss_percent", 100}}}}),
               ConfigError);
  EXPECT_THROW(parseEngineConfig({{"risk", {{"starting_capital", -1}}}}),
               ConfigError);
  EXPECT_THROW(parseEngineConfig({{"confidence_threshold", 101}}), ConfigError);
  EXPECT_THROW(parseEngineConfig({{"poll_interval_seconds", 0}}), ConfigError);
  EXPECT_THROW(parseEngineConfig({{"symbol", ""}}), ConfigError);
  EXPECT_THROW(
      parseEngineConfig({{"strategies", {{"x", {{"weight", 1.5}}}}}}),
      ConfigError);
}

TEST_F(EngineConfigTest, TypeErrorsNameTheKey) {
  try {
    parseEngineConfig({{"risk", {{"starting_capital", "lots"}}}});
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("risk.starting_capital"),
              std::string::npos);
  }

  EXPECT_THROW(parseEngineConfig({{"risk", 5}}), ConfigError);
  EXPECT_THROW(parseEngineConfig(json::array()), ConfigError);
}

// -----------------------------------------------------------------------------
// 3. Environment overrides the file.
// Why: Switching to live trading must not require editing the config.
// -----------------------------------------------------------------------------
TEST_F(EngineConfigTest, EnvironmentOverrides) {
  EngineConfig c;
  setenv("AUTOTRADER_PAPER_TRADING", "false", 1);
  setenv("AUTOTRADER_VENUE", "BinanceUS", 1);

  autotrader::applyEnvironmentOverrides(c);

  EXPECT_FALSE(c.paper_trading);
  EXPECT_EQ(c.venue, "binanceus");
}

TEST_F(EngineConfigTest, InvalidPaperFlagThrows) {
  EngineConfig c;
  setenv("AUTOTRADER_PAPER_TRADING", "maybe", 1);

  EXPECT_THROW(autotrader::applyEnvironmentOverrides(c), ConfigError);
}

TEST_F(EngineConfigTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "autotrader_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"symbol": "SOL/USDT", "risk": {"stop_loss_percent": 3}})";
  }

  EngineConfig c = autotrader::loadEngineConfig(path);
  EXPECT_EQ(c.symbol, "SOL/USDT");
  EXPECT_DOUBLE_EQ(c.risk.stop_loss_percent, 3.0);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(autotrader::loadEngineConfig(path), ConfigError);
  EXPECT_THROW(autotrader::loadEngineConfig(path + ".missing"), ConfigError);
}
