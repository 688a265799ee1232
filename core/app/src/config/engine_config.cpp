#include "autotrader/config/engine_config.hpp"
#include "autotrader/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace autotrader {

namespace {

// Reads document[key] into out when present. A type mismatch becomes a
// ConfigError carrying the dotted key path.
template <typename T>
void readOptional(const nlohmann::json& document, const char* key,
                  const std::string& path, T& out) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("config key '" + path + key + "': " + e.what());
  }
}

const nlohmann::json& section(const nlohmann::json& document,
                              const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + key +
                      "' must be an object");
  }
  return *it;
}

void requirePercent(double value, const char* name, bool allow_zero) {
  if (!(value <= 100.0) || (allow_zero ? value < 0.0 : value <= 0.0)) {
    throw ConfigError(std::string(name) + " must be in " +
                      (allow_zero ? "[0, 100]" : "(0, 100]") + ", got " +
                      std::to_string(value));
  }
}

void requirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    throw ConfigError(std::string(name) + " must be positive, got " +
                      std::to_string(value));
  }
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("config document must be a JSON object");
  }

  EngineConfig config;

  readOptional(document, "symbol", "", config.symbol);
  double poll_seconds = static_cast<double>(config.poll_interval_ms) / 1000.0;
  double backoff_seconds =
      static_cast<double>(config.error_backoff_ms) / 1000.0;
  readOptional(document, "poll_interval_seconds", "", poll_seconds);
  readOptional(document, "error_backoff_seconds", "", backoff_seconds);
  requirePositive(poll_seconds, "poll_interval_seconds");
  requirePositive(backoff_seconds, "error_backoff_seconds");
  config.poll_interval_ms = static_cast<std::int64_t>(poll_seconds * 1000.0);
  config.error_backoff_ms =
      static_cast<std::int64_t>(backoff_seconds * 1000.0);
  readOptional(document, "confidence_threshold", "",
               config.confidence_threshold);

  const auto& risk = section(document, "risk");
  readOptional(risk, "position_size_percent", "risk.",
               config.risk.position_size_percent);
  readOptional(risk, "daily_loss_limit_percent", "risk.",
               config.risk.daily_loss_limit_percent);
  readOptional(risk, "kill_switch_percent", "risk.",
               config.risk.kill_switch_percent);
  readOptional(risk, "starting_capital", "risk.",
               config.risk.starting_capital);
  readOptional(risk, "stop_loss_percent", "risk.",
               config.risk.stop_loss_percent);

  const auto& execution = section(document, "execution");
  readOptional(execution, "paper_trading", "execution.",
               config.paper_trading);
  readOptional(execution, "venue", "execution.", config.venue);
  readOptional(execution, "paper_reference_price", "execution.",
               config.paper_reference_price);
  readOptional(execution, "exchange_endpoint", "execution.",
               config.exchange_endpoint);
  readOptional(execution, "exchange_timeout_ms", "execution.",
               config.exchange_timeout_ms);

  const auto& market = section(document, "market_data");
  readOptional(market, "endpoint", "market_data.",
               config.market_data_endpoint);
  readOptional(market, "series_capacity", "market_data.",
               config.series_capacity);
  double max_age_seconds = static_cast<double>(config.max_tick_age_ms) / 1000.0;
  readOptional(market, "max_tick_age_seconds", "market_data.",
               max_age_seconds);
  requirePositive(max_age_seconds, "market_data.max_tick_age_seconds");
  config.max_tick_age_ms = static_cast<std::int64_t>(max_age_seconds * 1000.0);
  readOptional(market, "receive_timeout_ms", "market_data.",
               config.market_data_timeout_ms);

  const auto& control = section(document, "control");
  readOptional(control, "command_endpoint", "control.",
               config.command_endpoint);
  readOptional(control, "telemetry_endpoint", "control.",
               config.telemetry_endpoint);

  const auto& persistence = section(document, "persistence");
  readOptional(persistence, "data_dir", "persistence.", config.data_dir);

  const auto& strategies = section(document, "strategies");
  for (const auto& [name, entry] : strategies.items()) {
    if (!entry.is_object()) {
      throw ConfigError("config strategy '" + name + "' must be an object");
    }
    const std::string path = "strategies." + name + ".";
    StrategyConfig sc;
    readOptional(entry, "weight", path, sc.weight);
    readOptional(entry, "enabled", path, sc.enabled);
    readOptional(entry, "params", path, sc.params);
    config.strategies[name] = std::move(sc);
  }

  validateEngineConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }

  EngineConfig config = parseEngineConfig(document);
  applyEnvironmentOverrides(config);
  return config;
}

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(EngineConfig& config) {
  if (const char* paper = std::getenv("AUTOTRADER_PAPER_TRADING")) {
    const std::string value = lower(paper);
    if (value == "true" || value == "1" || value == "yes") {
      config.paper_trading = true;
    } else if (value == "false" || value == "0" || value == "no") {
      config.paper_trading = false;
    } else {
      throw ConfigError("AUTOTRADER_PAPER_TRADING must be true or false, got '" +
                        std::string(paper) + "'");
    }
    std::cout << "[Config] paper_trading overridden from environment: "
              << (config.paper_trading ? "true" : "false") << "\n";
  }

  if (const char* venue = std::getenv("AUTOTRADER_VENUE")) {
    if (*venue != '\0') {
      config.venue = lower(venue);
      std::cout << "[Config] venue overridden from environment: "
                << config.venue << "\n";
    }
  }

  validateEngineConfig(config);
}

// -----------------------------------------------------------------------------
// validateEngineConfig
// -----------------------------------------------------------------------------
void validateEngineConfig(const EngineConfig& config) {
  if (config.symbol.empty()) {
    throw ConfigError("symbol must not be empty");
  }
  if (config.poll_interval_ms <= 0 || config.error_backoff_ms <= 0) {
    throw ConfigError("poll interval and error backoff must be positive");
  }
  requirePercent(config.confidence_threshold, "confidence_threshold", true);

  requirePercent(config.risk.position_size_percent,
                 "risk.position_size_percent", false);
  requirePercent(config.risk.daily_loss_limit_percent,
                 "risk.daily_loss_limit_percent", false);
  requirePercent(config.risk.kill_switch_percent, "risk.kill_switch_percent",
                 false);
  requirePercent(config.risk.stop_loss_percent, "risk.stop_loss_percent",
                 false);
  if (config.risk.stop_loss_percent >= 100.0) {
    throw ConfigError("risk.stop_loss_percent must be below 100");
  }
  requirePositive(config.risk.starting_capital, "risk.starting_capital");

  if (config.venue.empty()) {
    throw ConfigError("execution.venue must not be empty");
  }
  requirePositive(config.paper_reference_price,
                  "execution.paper_reference_price");
  if (config.exchange_timeout_ms <= 0 || config.market_data_timeout_ms <= 0) {
    throw ConfigError("receive timeouts must be positive");
  }
  if (config.series_capacity == 0) {
    throw ConfigError("market_data.series_capacity must be at least 1");
  }

  for (const auto& [name, sc] : config.strategies) {
    if (!(sc.weight >= 0.0 && sc.weight <= 1.0)) {
      throw ConfigError("strategies." + name + ".weight must be in [0, 1]");
    }
  }
}

}  // namespace autotrader
