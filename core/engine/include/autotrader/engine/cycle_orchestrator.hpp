#pragma once

#include "autotrader/config/engine_config.hpp"
#include "autotrader/domain/engine_state.hpp"
#include "autotrader/domain/market_snapshot.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/domain/risk_state.hpp"
#include "autotrader/engine/engine_context.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/execution/i_execution_adapter.hpp"
#include "autotrader/gateway/i_market_data_provider.hpp"
#include "autotrader/persistence/i_trade_store.hpp"
#include "autotrader/risk/position_ledger.hpp"
#include "autotrader/risk/risk_governor.hpp"
#include "autotrader/strategy/signal_aggregator.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// EngineStatus: consistent snapshot for readers on other threads
// -----------------------------------------------------------------------------
struct EngineStatus {
  std::string symbol;
  domain::EngineState state{domain::EngineState::Idle};
  bool paused{false};
  EngineContext context;
  domain::RiskState risk;
  std::vector<domain::Position> open_positions;
  std::vector<SourceInfo> sources;
  std::int64_t last_cycle_ms{0};
  std::string last_error;
};

// -----------------------------------------------------------------------------
// CycleOrchestrator: the engine loop
// -----------------------------------------------------------------------------
//
// @brief  Sequences one trading cycle and repeats it on the poll interval
//         until stopped or halted by the kill switch.
//
// @details
// One cycle, in order:
//   0. Apply operator commands queued since the last cycle (pause, resume,
//      kill-switch reset; close-all is latched here and acted on in 4b).
//   1. Daily rollover from the injected clock's UTC day. A rollover also
//      zeroes the daily realized P&L.
//   2. Fetch the market snapshot.
//   3. Revalue every open position of the symbol; persist and publish.
//   4. Close every stop-loss breach with a sell order, unconditionally.
//   4b. Close everything if the operator asked for close-all.
//   5. Recompute loss figures and check the kill switch. If it trips:
//      liquidate, persist, publish KillSwitchEvent, log CRITICAL, HALTED.
//   6. If paused, skip to 8.
//   7. Aggregate signals. BUY without a position or SELL with one goes to
//      RiskGovernor::validate; approved BUY opens a position with a
//      stop-loss order, approved SELL closes the position. A rejection is
//      logged and published as RiskRejectEvent.
//   8. Persist engine state and publish EngineStatusEvent.
//
// run() catches std::exception at the cycle boundary, logs it and sleeps
// the shorter error backoff instead of the poll interval. Only the kill
// switch or requestStop() ends the loop.
//
// States:
//   IDLE -> RUNNING (run())  -> IDLE (stop requested)
//                            -> HALTED (kill switch)
//   HALTED -> IDLE only through resetKillSwitch().
//   paused is a flag inside RUNNING: revaluation and stop-loss monitoring
//   continue, new signals are ignored.
//
// Thread model:
//   run() and runCycle() execute on one thread (the orchestrator thread),
//   which is the only writer of the ledger, the risk state and the
//   EngineContext. Command methods (pause, resume, closeAll,
//   resetKillSwitch, requestStop) may be called from any thread; they set
//   atomic flags that the next cycle reads. requestStop() also wakes a
//   sleeping loop. status() may be called from any thread; it reads the
//   balance and the open positions under the same lock that opening and
//   closing hold, so a position is never counted twice or not at all.
//
// Ownership:
//   Holds references to every collaborator; all must outlive it. Owns the
//   EngineContext.
// -----------------------------------------------------------------------------
class CycleOrchestrator {
 public:
  CycleOrchestrator(const EngineConfig& config, const ITimeProvider& clock,
                    IMarketDataProvider& market_data,
                    SignalAggregator& aggregator, RiskGovernor& risk,
                    PositionLedger& ledger, IExecutionAdapter& execution,
                    ITradeStore& store, EventBus& bus);

  CycleOrchestrator(const CycleOrchestrator&) = delete;
  CycleOrchestrator& operator=(const CycleOrchestrator&) = delete;
  CycleOrchestrator(CycleOrchestrator&&) = delete;
  CycleOrchestrator& operator=(CycleOrchestrator&&) = delete;

  // -------------------------------------------------------------------------
  // restore()
  // -------------------------------------------------------------------------
  // @brief  Rehydrates the ledger and engine state from the store. Call
  //         once, before run(). A persisted kill-switch latch puts the
  //         orchestrator straight into HALTED.
  // -------------------------------------------------------------------------
  void restore();

  // Blocks until requestStop() or a kill-switch halt. Returns immediately
  // if already HALTED.
  void run();

  // -------------------------------------------------------------------------
  // runCycle()
  // -------------------------------------------------------------------------
  // @brief  Executes exactly one cycle. Exceptions from collaborators
  //         propagate; run() is the boundary that catches them.
  // -------------------------------------------------------------------------
  void runCycle();

  // Cancellation token. Takes effect at the next suspension point; a
  // running cycle always completes.
  void requestStop();

  // -------------------------------------------------------------------------
  // awaitKillSwitchReset()
  // -------------------------------------------------------------------------
  // @brief  Blocks while HALTED. Returns true once resetKillSwitch() moved
  //         the orchestrator back to IDLE, false if requestStop() came
  //         first.
  // -------------------------------------------------------------------------
  bool awaitKillSwitchReset();

  // Operator controls. Take effect at the top of the next cycle.
  void pause();
  void resume();
  void closeAll();

  // -------------------------------------------------------------------------
  // resetKillSwitch()
  // -------------------------------------------------------------------------
  // @brief  Clears the kill-switch latch. Applied immediately when the loop
  //         is not running (and a HALTED orchestrator becomes IDLE),
  //         otherwise at the top of the next cycle.
  // -------------------------------------------------------------------------
  void resetKillSwitch();

  // Registry controls, forwarded to the aggregator. Read at the start of
  // each cycle. Return false for an unknown source name.
  bool setStrategyWeight(const std::string& name, double weight);
  bool enableStrategy(const std::string& name);
  bool disableStrategy(const std::string& name);

  domain::EngineState state() const { return state_.load(); }
  bool paused() const { return paused_.load(); }
  EngineStatus status() const;

 private:
  void applyPendingCommands();
  void applyKillSwitchReset();

  void revaluePositions(const domain::MarketSnapshot& snapshot);
  void handleStopLossBreaches(const domain::MarketSnapshot& snapshot);
  void handleCloseAll(const domain::MarketSnapshot& snapshot);
  void tradeOnSignal(const domain::MarketSnapshot& snapshot);
  void haltOnKillSwitch(const domain::MarketSnapshot& snapshot,
                        double total_loss_percent);

  // Buys the sized amount and opens the position at the confirmed fill,
  // then places the protective stop and records its id.
  void openPosition(const domain::MarketSnapshot& snapshot,
                    const AggregationResult& decision);

  // Cancels the position's resting stop order, if any. A failed cancel is
  // logged and does not block the exit.
  void cancelStopOrder(const domain::Position& position);

  // Sells the whole position, books the realized P&L at the confirmed fill
  // price (exit_price when the venue reports none) and records the Trade.
  // decision is null for exits that did not come from a signal (stop-loss,
  // close-all, kill switch).
  void closePosition(const domain::Position& position, double exit_price,
                     const std::string& rationale,
                     const AggregationResult* decision);

  double dailyLossPercent() const;
  double totalLossPercent() const;
  void refreshLossFigures();

  void persistEngineState();
  void persistPosition(domain::PositionId id);

  // Publishes without letting a subscriber failure escape.
  void notify(const Event& event);
  void publishStatus();

  void logCriticalSnapshot(const std::string& reason) const;
  void sleepFor(std::int64_t ms);

  const EngineConfig config_;
  const ITimeProvider& clock_;
  IMarketDataProvider& market_data_;
  SignalAggregator& aggregator_;
  RiskGovernor& risk_;
  PositionLedger& ledger_;
  IExecutionAdapter& execution_;
  ITradeStore& store_;
  EventBus& bus_;

  // Held around every change that moves value between the ledger and the
  // balance, and by status(). Acquired before context_mutex_.
  mutable std::mutex book_mutex_;
  mutable std::mutex context_mutex_;  // Guards context_, last_* fields
  EngineContext context_;
  std::int64_t last_cycle_ms_{0};
  std::string last_error_;

  std::atomic<domain::EngineState> state_{domain::EngineState::Idle};
  std::atomic<bool> paused_{false};

  std::atomic<bool> pending_pause_{false};
  std::atomic<bool> pending_resume_{false};
  std::atomic<bool> pending_close_all_{false};
  std::atomic<bool> pending_reset_{false};

  // Guards the running/immediate decision of resetKillSwitch() against
  // run() starting or finishing.
  std::mutex lifecycle_mutex_;
  bool loop_active_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace autotrader
