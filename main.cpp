// -----------------------------------------------------------------------------
// autotrader: single executable entry point.
//
//   autotrader [config.json] [--reset-kill-switch]
//
// Startup:
//   1) Load EngineConfig (defaults when no path is given) and apply the
//      AUTOTRADER_PAPER_TRADING / AUTOTRADER_VENUE environment overrides.
//   2) Build the collaborators: clock, ZMQ market data feed, trade store,
//      signal aggregator with its analysis modules, risk governor, position
//      ledger, and the paper or live execution adapter.
//   3) Restore open positions and engine state from the store. With
//      --reset-kill-switch, clear a persisted kill-switch latch.
//   4) Start the ControlServer (operator commands + telemetry).
//   5) Run the CycleOrchestrator loop on the main thread until SIGINT/SIGTERM
//      or the STOP command. A kill-switch halt keeps the process (and the
//      control server) alive until an operator resets it or stops.
//
// Thread layout:
//   main thread     -> CycleOrchestrator::run()
//   control thread  -> ControlServer (REP commands, PUB telemetry)
// -----------------------------------------------------------------------------

#include "autotrader/config/engine_config.hpp"
#include "autotrader/engine/command_handler.hpp"
#include "autotrader/engine/cycle_orchestrator.hpp"
#include "autotrader/errors.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/execution/live_execution_adapter.hpp"
#include "autotrader/execution/paper_execution_adapter.hpp"
#include "autotrader/execution/zmq_exchange_client.hpp"
#include "autotrader/gateway/zmq_market_data_provider.hpp"
#include "autotrader/network/control_server.hpp"
#include "autotrader/persistence/json_file_trade_store.hpp"
#include "autotrader/risk/position_ledger.hpp"
#include "autotrader/risk/risk_governor.hpp"
#include "autotrader/strategy/moving_average_cross_strategy.hpp"
#include "autotrader/strategy/signal_aggregator.hpp"
#include "autotrader/time/live_time_provider.hpp"
#include "autotrader/time/time_utils.hpp"

#include <pthread.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::size_t paramOr(const autotrader::StrategyConfig& sc, const char* key,
                    std::size_t fallback) {
  auto it = sc.params.find(key);
  return it == sc.params.end() ? fallback
                               : static_cast<std::size_t>(it->second);
}

// Registers every analysis module the binary ships with. Modules without a
// config entry are registered with weight 1.0, enabled.
void registerAnalysisModules(const autotrader::EngineConfig& config,
                             autotrader::SignalAggregator& aggregator) {
  using autotrader::MovingAverageCrossStrategy;

  autotrader::StrategyConfig ma;
  if (auto it = config.strategies.find(MovingAverageCrossStrategy::kName);
      it != config.strategies.end()) {
    ma = it->second;
  }
  double points = 10.0;
  if (auto it = ma.params.find("points_per_percent"); it != ma.params.end()) {
    points = it->second;
  }
  aggregator.registerSource(
      std::make_shared<MovingAverageCrossStrategy>(
          paramOr(ma, "short_window", 10), paramOr(ma, "long_window", 30),
          points),
      ma.weight, ma.enabled);

  for (const auto& [name, sc] : config.strategies) {
    if (name != MovingAverageCrossStrategy::kName) {
      std::cerr << "[main] WARNING: no analysis module named '" << name
                << "', config entry ignored\n";
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool reset_kill_switch = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--reset-kill-switch") == 0) {
      reset_kill_switch = true;
    } else {
      config_path = argv[i];
    }
  }

  // SIGINT/SIGTERM are blocked in every thread and consumed by a dedicated
  // sigwait() thread, so requestStop() never runs in signal context. The
  // mask must be set before any thread is spawned.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  try {
    // -----------------------------------------------------------------------
    // 1) Configuration
    // -----------------------------------------------------------------------
    autotrader::EngineConfig config;
    if (config_path.empty()) {
      std::cout << "[main] no config file given, using defaults\n";
      autotrader::applyEnvironmentOverrides(config);
    } else {
      config = autotrader::loadEngineConfig(config_path);
    }
    std::cout << "[main] symbol=" << config.symbol << " mode="
              << (config.paper_trading ? "PAPER" : "LIVE")
              << " venue=" << config.venue << "\n";

    // -----------------------------------------------------------------------
    // 2) Collaborators
    // -----------------------------------------------------------------------
    autotrader::LiveTimeProvider clock;
    autotrader::EventBus bus;

    autotrader::ZmqMarketDataProvider market_data(
        clock, config.market_data_endpoint, config.series_capacity,
        config.max_tick_age_ms, config.market_data_timeout_ms);

    autotrader::JsonFileTradeStore store(config.data_dir);

    autotrader::SignalAggregator aggregator(config.confidence_threshold);
    registerAnalysisModules(config, aggregator);

    autotrader::RiskGovernor risk(config.risk,
                                  autotrader::utc_day(clock.now_ms()));
    autotrader::PositionLedger ledger;

    std::unique_ptr<autotrader::ZmqExchangeClient> exchange;
    std::unique_ptr<autotrader::IExecutionAdapter> execution;
    if (config.paper_trading) {
      execution = std::make_unique<autotrader::PaperExecutionAdapter>(
          config.paper_reference_price);
    } else {
      std::cout << "[main] LIVE trading through " << config.exchange_endpoint
                << "\n";
      exchange = std::make_unique<autotrader::ZmqExchangeClient>(
          config.exchange_endpoint, config.exchange_timeout_ms);
      execution = std::make_unique<autotrader::LiveExecutionAdapter>(
          *exchange, config.venue);
    }

    autotrader::CycleOrchestrator orchestrator(config, clock, market_data,
                                               aggregator, risk, ledger,
                                               *execution, store, bus);

    // -----------------------------------------------------------------------
    // 3) Restore
    // -----------------------------------------------------------------------
    orchestrator.restore();
    if (reset_kill_switch) {
      orchestrator.resetKillSwitch();
    }

    bus.subscribe<autotrader::KillSwitchEvent>(
        [](const autotrader::KillSwitchEvent& e) {
          std::cerr << "[main] CRITICAL: " << e.reason
                    << ". Send RESET_KILL_SWITCH or restart with "
                       "--reset-kill-switch after review.\n";
        });

    // -----------------------------------------------------------------------
    // 4) Control server
    // -----------------------------------------------------------------------
    autotrader::ControlServer control(
        bus,
        [&orchestrator](const std::string& cmd) {
          return autotrader::executeCommand(orchestrator, cmd);
        },
        config.command_endpoint, config.telemetry_endpoint);
    control.start();

    std::atomic<bool> shutting_down{false};
    std::thread signal_thread([&stop_signals, &shutting_down, &orchestrator] {
      int received = 0;
      sigwait(&stop_signals, &received);
      if (!shutting_down.load()) {
        std::cout << "\n[main] " << (received == SIGINT ? "SIGINT" : "SIGTERM")
                  << " received. Shutting down...\n";
        orchestrator.requestStop();
      }
    });

    // -----------------------------------------------------------------------
    // 5) Run until stopped. A halt waits for an operator reset.
    // -----------------------------------------------------------------------
    for (;;) {
      orchestrator.run();
      if (orchestrator.state() != autotrader::domain::EngineState::Halted) {
        break;
      }
      std::cerr << "[main] engine HALTED. Waiting for RESET_KILL_SWITCH or "
                   "STOP on "
                << config.command_endpoint << "\n";
      if (!orchestrator.awaitKillSwitchReset()) {
        break;
      }
    }

    // Wake the signal thread if no signal arrived.
    shutting_down.store(true);
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();

    control.stop();
    std::cout << "[main] shutdown complete\n";
    return orchestrator.state() == autotrader::domain::EngineState::Halted ? 2
                                                                           : 0;
  } catch (const autotrader::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
}
