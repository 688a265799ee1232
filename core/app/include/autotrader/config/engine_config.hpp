#pragma once

#include "autotrader/domain/risk_limits.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// StrategyConfig: per-source registration settings
// -----------------------------------------------------------------------------
// weight and enabled are the initial registry values; both stay
// operator-mutable at runtime. params holds module-specific numeric knobs
// (e.g. moving-average windows) so new modules need no schema change.
// -----------------------------------------------------------------------------
struct StrategyConfig {
  double weight{1.0};
  bool enabled{true};
  std::map<std::string, double> params;
};

// -----------------------------------------------------------------------------
// EngineConfig: every externally supplied setting of the engine
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Default member initializers are the
//         production defaults; a JSON document overrides any subset.
//
// @details
// Grouped the same way as the JSON document:
//   top level    symbol, cadence, aggregation threshold
//   risk         RiskLimits (sizing, daily limit, kill switch, stop distance)
//   execution    paper/live mode, venue, paper reference price, bridge
//   market_data  feed endpoint, rolling series length, staleness bound
//   control      operator command and telemetry endpoints
//   persistence  directory for the journals and engine state
//   strategies   per-source weights, enabled flags and parameters
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string symbol{"BTC/USDT"};
  std::int64_t poll_interval_ms{300'000};
  std::int64_t error_backoff_ms{60'000};
  double confidence_threshold{70.0};

  domain::RiskLimits risk;

  bool paper_trading{true};
  std::string venue{"okx"};
  double paper_reference_price{50'000.0};
  std::string exchange_endpoint{"tcp://127.0.0.1:5560"};
  int exchange_timeout_ms{5'000};

  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::size_t series_capacity{100};
  std::int64_t max_tick_age_ms{900'000};
  int market_data_timeout_ms{2'000};

  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  std::string data_dir{"data"};

  std::map<std::string, StrategyConfig> strategies;
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json)
// -----------------------------------------------------------------------------
// @brief  Builds an EngineConfig from a parsed JSON document.
//
// @details
// Every key is optional. Wrong JSON types and out-of-range values raise
// ConfigError naming the offending key. Does not consult the environment.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads the file at path, parses it, then applies environment
//         overrides.
//
// @throws ConfigError if the file cannot be opened or is not valid JSON.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

// Applies AUTOTRADER_PAPER_TRADING (true/false/1/0) and AUTOTRADER_VENUE.
void applyEnvironmentOverrides(EngineConfig& config);

// Range checks shared by parse and override paths.
void validateEngineConfig(const EngineConfig& config);

}  // namespace autotrader
