#include "autotrader/engine/cycle_orchestrator.hpp"
#include "autotrader/errors.hpp"
#include "autotrader/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace autotrader {

namespace {

std::vector<domain::SignalSnapshot> snapshotSignals(
    const AggregationResult* decision) {
  std::vector<domain::SignalSnapshot> out;
  if (decision == nullptr) {
    return out;
  }
  for (const auto& op : decision->opinions) {
    if (op.enabled) {
      out.push_back(domain::SignalSnapshot{op.source_name, op.signal.direction,
                                           op.signal.confidence, op.weight});
    }
  }
  return out;
}

}  // namespace

CycleOrchestrator::CycleOrchestrator(
    const EngineConfig& config, const ITimeProvider& clock,
    IMarketDataProvider& market_data, SignalAggregator& aggregator,
    RiskGovernor& risk, PositionLedger& ledger, IExecutionAdapter& execution,
    ITradeStore& store, EventBus& bus)
    : config_(config),
      clock_(clock),
      market_data_(market_data),
      aggregator_(aggregator),
      risk_(risk),
      ledger_(ledger),
      execution_(execution),
      store_(store),
      bus_(bus) {
  context_.balance = config_.risk.starting_capital;
}

// -----------------------------------------------------------------------------
// restore(): warm-up from the store, before run()
// -----------------------------------------------------------------------------
void CycleOrchestrator::restore() {
  if (auto saved = store_.loadEngineState()) {
    risk_.hydrate(saved->risk);
    std::lock_guard lock(context_mutex_);
    context_.balance = saved->balance;
    context_.daily_realized_pnl = saved->daily_realized_pnl;
    context_.total_realized_pnl = saved->total_realized_pnl;
    std::cout << "[CycleOrchestrator] restored engine state. balance="
              << context_.balance
              << " total_realized_pnl=" << context_.total_realized_pnl
              << "\n";
  }

  const auto positions = store_.loadOpenPositions();
  for (const auto& p : positions) {
    ledger_.hydrate(p);
  }
  std::cout << "[CycleOrchestrator] restored " << positions.size()
            << " open position(s)\n";

  if (risk_.locked()) {
    {
      std::lock_guard lock(wake_mutex_);
      state_.store(domain::EngineState::Halted);
    }
    logCriticalSnapshot(
        "kill switch latched in a previous session; trading halted until "
        "reset");
  }
}

// -----------------------------------------------------------------------------
// run(): the loop. Cycle boundary catches std::exception.
// -----------------------------------------------------------------------------
void CycleOrchestrator::run() {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (state_.load() == domain::EngineState::Halted) {
      std::cerr << "[CycleOrchestrator] WARNING: run() refused, engine is "
                   "HALTED. Reset the kill switch first.\n";
      return;
    }
    loop_active_ = true;
    state_.store(domain::EngineState::Running);
  }

  std::cout << "[CycleOrchestrator] started. symbol=" << config_.symbol
            << " poll=" << config_.poll_interval_ms / 1000 << "s\n";
  publishStatus();

  while (!stop_requested_.load()) {
    std::int64_t sleep_ms = config_.poll_interval_ms;
    try {
      runCycle();
      std::lock_guard lock(context_mutex_);
      last_error_.clear();
    } catch (const std::exception& e) {
      std::cerr << "[CycleOrchestrator] WARNING: cycle failed: " << e.what()
                << ". Retrying in " << config_.error_backoff_ms / 1000
                << "s\n";
      std::lock_guard lock(context_mutex_);
      last_error_ = e.what();
      sleep_ms = config_.error_backoff_ms;
    }

    if (state_.load() == domain::EngineState::Halted) {
      break;
    }
    sleepFor(sleep_ms);
  }

  {
    std::lock_guard lock(lifecycle_mutex_);
    loop_active_ = false;
    if (state_.load() != domain::EngineState::Halted) {
      state_.store(domain::EngineState::Idle);
      stop_requested_.store(false);
    }
  }

  // A reset that arrived during the final cycle is applied now.
  if (pending_reset_.exchange(false)) {
    std::lock_guard lock(lifecycle_mutex_);
    applyKillSwitchReset();
  }

  publishStatus();
  std::cout << "[CycleOrchestrator] stopped. state="
            << domain::engineStateToString(state_.load()) << "\n";
}

// -----------------------------------------------------------------------------
// runCycle(): one pass, steps 0..8
// -----------------------------------------------------------------------------
void CycleOrchestrator::runCycle() {
  applyPendingCommands();

  if (state_.load() == domain::EngineState::Halted) {
    std::cout << "[CycleOrchestrator] HALTED, cycle skipped\n";
    return;
  }

  const std::int64_t now = clock_.now_ms();
  {
    std::lock_guard lock(context_mutex_);
    ++context_.cycle_count;
    last_cycle_ms_ = now;
  }

  if (risk_.rolloverIfNewDay(utc_day(now))) {
    std::lock_guard lock(context_mutex_);
    context_.daily_realized_pnl = 0.0;
  }

  const domain::MarketSnapshot snapshot =
      market_data_.fetchSnapshot(config_.symbol);
  if (!(snapshot.price > 0.0)) {
    throw MarketDataError("snapshot for " + config_.symbol +
                          " has no valid price");
  }
  execution_.onMarketPrice(snapshot.symbol, snapshot.price);

  revaluePositions(snapshot);
  handleStopLossBreaches(snapshot);
  if (pending_close_all_.exchange(false)) {
    handleCloseAll(snapshot);
  }

  refreshLossFigures();
  const double total_loss = totalLossPercent();
  if (risk_.checkKillSwitch(total_loss)) {
    haltOnKillSwitch(snapshot, total_loss);
    return;
  }

  if (paused_.load()) {
    std::cout << "[CycleOrchestrator] paused, no new entries\n";
  } else {
    tradeOnSignal(snapshot);
  }

  persistEngineState();
  publishStatus();

  const EngineStatus s = status();
  std::cout << "[CycleOrchestrator] cycle " << s.context.cycle_count
            << " done. price=" << snapshot.price
            << " balance=" << s.context.balance
            << " open=" << s.open_positions.size()
            << " daily_loss=" << s.risk.daily_loss_percent << "%"
            << " total_loss=" << s.risk.total_loss_percent << "%\n";
}

// -----------------------------------------------------------------------------
// Cancellation and sleeping
// -----------------------------------------------------------------------------
void CycleOrchestrator::requestStop() {
  {
    std::lock_guard lock(wake_mutex_);
    stop_requested_.store(true);
  }
  wake_cv_.notify_all();
}

void CycleOrchestrator::sleepFor(std::int64_t ms) {
  std::unique_lock lock(wake_mutex_);
  wake_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                    [this] { return stop_requested_.load(); });
}

bool CycleOrchestrator::awaitKillSwitchReset() {
  std::unique_lock lock(wake_mutex_);
  wake_cv_.wait(lock, [this] {
    return state_.load() != domain::EngineState::Halted ||
           stop_requested_.load();
  });
  return state_.load() != domain::EngineState::Halted;
}

// -----------------------------------------------------------------------------
// Operator commands
// -----------------------------------------------------------------------------
void CycleOrchestrator::pause() {
  pending_resume_.store(false);
  pending_pause_.store(true);
}

void CycleOrchestrator::resume() {
  pending_pause_.store(false);
  pending_resume_.store(true);
}

void CycleOrchestrator::closeAll() { pending_close_all_.store(true); }

void CycleOrchestrator::resetKillSwitch() {
  std::lock_guard lock(lifecycle_mutex_);
  if (loop_active_) {
    pending_reset_.store(true);
    return;
  }
  applyKillSwitchReset();
}

bool CycleOrchestrator::setStrategyWeight(const std::string& name,
                                          double weight) {
  return aggregator_.setWeight(name, weight);
}

bool CycleOrchestrator::enableStrategy(const std::string& name) {
  return aggregator_.enable(name);
}

bool CycleOrchestrator::disableStrategy(const std::string& name) {
  return aggregator_.disable(name);
}

void CycleOrchestrator::applyPendingCommands() {
  if (pending_pause_.exchange(false)) {
    paused_.store(true);
    std::cout << "[CycleOrchestrator] paused by operator\n";
  }
  if (pending_resume_.exchange(false)) {
    paused_.store(false);
    std::cout << "[CycleOrchestrator] resumed by operator\n";
  }
  if (pending_reset_.exchange(false)) {
    applyKillSwitchReset();
  }
}

void CycleOrchestrator::applyKillSwitchReset() {
  risk_.resetKillSwitch();
  {
    std::lock_guard lock(wake_mutex_);
    if (state_.load() == domain::EngineState::Halted) {
      state_.store(domain::EngineState::Idle);
    }
  }
  wake_cv_.notify_all();

  try {
    persistEngineState();
  } catch (const std::exception& e) {
    std::cerr << "[CycleOrchestrator] WARNING: kill switch reset not "
                 "persisted: "
              << e.what() << "\n";
  }
  std::cout << "[CycleOrchestrator] kill switch reset. state="
            << domain::engineStateToString(state_.load()) << "\n";
  publishStatus();
}

// -----------------------------------------------------------------------------
// Step 3: revalue
// -----------------------------------------------------------------------------
void CycleOrchestrator::revaluePositions(
    const domain::MarketSnapshot& snapshot) {
  for (const auto& pos : ledger_.openPositions()) {
    if (pos.symbol != snapshot.symbol) {
      continue;
    }
    ledger_.revalue(pos.id, snapshot.price);
    persistPosition(pos.id);
  }
}

// -----------------------------------------------------------------------------
// Step 4: stop-loss breaches, unconditional
// -----------------------------------------------------------------------------
void CycleOrchestrator::handleStopLossBreaches(
    const domain::MarketSnapshot& snapshot) {
  const auto breaches =
      ledger_.checkStopLossBreaches({{snapshot.symbol, snapshot.price}});
  for (const auto& pos : breaches) {
    std::ostringstream why;
    why << "stop-loss breach: price " << snapshot.price << " <= stop "
        << pos.stop_loss_price;
    std::cout << "[CycleOrchestrator] " << why.str() << " (position "
              << pos.id << ")\n";
    closePosition(pos, snapshot.price, why.str(), nullptr);
  }
}

void CycleOrchestrator::handleCloseAll(const domain::MarketSnapshot& snapshot) {
  const auto open = ledger_.openPositions();
  std::cout << "[CycleOrchestrator] close-all requested, closing "
            << open.size() << " position(s)\n";
  for (const auto& pos : open) {
    const double exit = pos.symbol == snapshot.symbol
                            ? snapshot.price
                            : execution_.currentPrice(pos.symbol);
    closePosition(pos, exit, "operator close-all", nullptr);
  }
}

// -----------------------------------------------------------------------------
// Step 5: kill switch tripped
// -----------------------------------------------------------------------------
void CycleOrchestrator::haltOnKillSwitch(const domain::MarketSnapshot& snapshot,
                                         double total_loss_percent) {
  std::size_t closed = 0;
  std::size_t failed = 0;
  for (const auto& pos : ledger_.openPositions()) {
    try {
      const double exit = pos.symbol == snapshot.symbol
                              ? snapshot.price
                              : execution_.currentPrice(pos.symbol);
      closePosition(pos, exit, "kill switch liquidation", nullptr);
      ++closed;
    } catch (const std::exception& e) {
      ++failed;
      std::cerr << "[CycleOrchestrator] CRITICAL: failed to liquidate "
                << "position " << pos.id << " " << pos.symbol << ": "
                << e.what() << "\n";
    }
  }

  refreshLossFigures();
  const domain::RiskState risk_state = risk_.state();

  try {
    persistEngineState();
  } catch (const std::exception& e) {
    std::cerr << "[CycleOrchestrator] CRITICAL: kill switch state not "
                 "persisted: "
              << e.what() << "\n";
  }

  {
    std::lock_guard lock(wake_mutex_);
    state_.store(domain::EngineState::Halted);
  }
  wake_cv_.notify_all();

  std::ostringstream reason;
  reason << "total loss " << std::fixed << std::setprecision(2)
         << total_loss_percent << "% reached kill switch threshold "
         << config_.risk.kill_switch_percent << "%";

  KillSwitchEvent event;
  event.total_loss_percent = total_loss_percent;
  event.threshold_percent = config_.risk.kill_switch_percent;
  event.risk_state = risk_state;
  event.positions_closed = closed;
  event.positions_failed = failed;
  event.reason = reason.str();
  event.timestamp_ms = clock_.now_ms();
  notify(event);

  logCriticalSnapshot("KILL SWITCH TRIPPED: " + reason.str() + ". Closed " +
                      std::to_string(closed) + ", failed " +
                      std::to_string(failed) + ". Trading HALTED.");
  publishStatus();
}

// -----------------------------------------------------------------------------
// Step 7: signal -> gate -> act
// -----------------------------------------------------------------------------
void CycleOrchestrator::tradeOnSignal(const domain::MarketSnapshot& snapshot) {
  const AggregationResult decision = aggregator_.evaluate(snapshot);
  const domain::Signal& signal = decision.combined;

  std::ostringstream line;
  line << "[CycleOrchestrator] signal "
       << domain::directionToString(signal.direction) << " " << std::fixed
       << std::setprecision(2) << signal.confidence << ": "
       << signal.rationale << "\n";
  std::cout << line.str();

  if (signal.direction == domain::Direction::Hold) {
    return;
  }

  const auto open = ledger_.openPositionFor(snapshot.symbol);
  if (signal.direction == domain::Direction::Buy && open.has_value()) {
    std::cout << "[CycleOrchestrator] BUY ignored, position " << open->id
              << " already open\n";
    return;
  }
  if (signal.direction == domain::Direction::Sell && !open.has_value()) {
    std::cout << "[CycleOrchestrator] SELL ignored, no open position\n";
    return;
  }

  double balance = 0.0;
  {
    std::lock_guard lock(context_mutex_);
    balance = context_.balance;
  }

  const ValidationResult verdict = risk_.validate(balance, dailyLossPercent());
  if (!verdict.approved) {
    std::cout << "[CycleOrchestrator] trade rejected: " << verdict.reason
              << "\n";
    notify(RiskRejectEvent{snapshot.symbol, verdict.reason, clock_.now_ms()});
    return;
  }

  if (signal.direction == domain::Direction::Buy) {
    openPosition(snapshot, decision);
  } else {
    closePosition(*open, snapshot.price, signal.rationale, &decision);
  }
}

void CycleOrchestrator::openPosition(const domain::MarketSnapshot& snapshot,
                                     const AggregationResult& decision) {
  double balance = 0.0;
  {
    std::lock_guard lock(context_mutex_);
    balance = context_.balance;
  }

  const double requested = risk_.sizePosition(balance) / snapshot.price;
  const domain::OrderResult order = execution_.buy(snapshot.symbol, requested);

  // Book what the venue confirmed; the snapshot price only stands in when
  // the venue reported no fill price.
  const double price = order.fill_price > 0.0 ? order.fill_price : snapshot.price;
  const double amount = order.amount > 0.0 ? order.amount : requested;
  const double stop = price * (1.0 - config_.risk.stop_loss_percent / 100.0);
  if (amount < requested) {
    std::cerr << "[CycleOrchestrator] WARNING: partial fill on " << order.id
              << ": " << amount << " of " << requested << " "
              << snapshot.symbol << "\n";
  }

  domain::Position pos;
  {
    std::lock_guard book(book_mutex_);
    pos = ledger_.open(snapshot.symbol, price, amount, stop, clock_.now_ms());
    std::lock_guard lock(context_mutex_);
    context_.balance -= price * amount;
  }

  try {
    const domain::OrderResult stop_order =
        execution_.placeStopLoss(snapshot.symbol, amount, stop);
    ledger_.attachStopOrder(pos.id, stop_order.id);
  } catch (const ExecutionError& e) {
    std::cerr << "[CycleOrchestrator] WARNING: stop-loss order not placed for "
              << "position " << pos.id << ": " << e.what()
              << ". Breach monitoring continues each cycle.\n";
  }

  domain::Trade trade;
  trade.symbol = snapshot.symbol;
  trade.side = domain::Side::Buy;
  trade.amount = amount;
  trade.entry_price = price;
  trade.signal_snapshot = snapshotSignals(&decision);
  trade.rationale = decision.combined.rationale;
  trade.timestamp_ms = clock_.now_ms();
  trade.position_id = pos.id;
  trade.order_id = order.id;
  trade.simulated = order.simulated;

  persistPosition(pos.id);
  store_.saveTrade(trade);
  notify(TradeExecutedEvent{trade});

  std::cout << "[CycleOrchestrator] BUY " << amount << " " << snapshot.symbol
            << " @ " << price << " stop=" << stop << " order=" << order.id
            << "\n";
}

void CycleOrchestrator::cancelStopOrder(const domain::Position& position) {
  if (position.stop_order_id.empty()) {
    return;
  }
  try {
    execution_.cancelOrder(position.stop_order_id, position.symbol);
  } catch (const ExecutionError& e) {
    std::cerr << "[CycleOrchestrator] WARNING: stop order "
              << position.stop_order_id << " for position " << position.id
              << " may still be resting on the venue: " << e.what() << "\n";
  }
}

void CycleOrchestrator::closePosition(const domain::Position& position,
                                      double exit_price,
                                      const std::string& rationale,
                                      const AggregationResult* decision) {
  cancelStopOrder(position);

  const domain::OrderResult order =
      execution_.sell(position.symbol, position.amount);
  const double exit = order.fill_price > 0.0 ? order.fill_price : exit_price;
  if (order.amount > 0.0 && order.amount < position.amount) {
    std::cerr << "[CycleOrchestrator] WARNING: partial exit on " << order.id
              << ": " << order.amount << " of " << position.amount << " "
              << position.symbol << " sold\n";
  }

  std::optional<double> realized;
  {
    std::lock_guard book(book_mutex_);
    realized = ledger_.close(position.id, exit);
    if (realized.has_value()) {
      std::lock_guard lock(context_mutex_);
      context_.balance += exit * position.amount;
      context_.daily_realized_pnl += *realized;
      context_.total_realized_pnl += *realized;
    }
  }
  if (!realized.has_value()) {
    return;
  }

  domain::Trade trade;
  trade.symbol = position.symbol;
  trade.side = domain::Side::Sell;
  trade.amount = position.amount;
  trade.entry_price = position.entry_price;
  trade.exit_price = exit;
  trade.realized_pnl = *realized;
  trade.signal_snapshot = snapshotSignals(decision);
  trade.rationale = rationale;
  trade.timestamp_ms = clock_.now_ms();
  trade.position_id = position.id;
  trade.order_id = order.id;
  trade.simulated = order.simulated;

  persistPosition(position.id);
  store_.saveTrade(trade);
  notify(TradeExecutedEvent{trade});

  std::cout << "[CycleOrchestrator] SELL " << position.amount << " "
            << position.symbol << " @ " << exit
            << " realized_pnl=" << *realized << " (" << rationale << ")\n";
}

// -----------------------------------------------------------------------------
// Loss figures: losses only, as a percent of starting capital
// -----------------------------------------------------------------------------
double CycleOrchestrator::dailyLossPercent() const {
  std::lock_guard lock(context_mutex_);
  return std::max(0.0, -context_.daily_realized_pnl) /
         config_.risk.starting_capital * 100.0;
}

double CycleOrchestrator::totalLossPercent() const {
  double realized = 0.0;
  {
    std::lock_guard lock(context_mutex_);
    realized = context_.total_realized_pnl;
  }
  const double pnl = realized + ledger_.unrealizedPnl();
  return std::max(0.0, -pnl) / config_.risk.starting_capital * 100.0;
}

void CycleOrchestrator::refreshLossFigures() {
  risk_.recordLoss(dailyLossPercent(), totalLossPercent());
}

// -----------------------------------------------------------------------------
// Persistence and notification
// -----------------------------------------------------------------------------
void CycleOrchestrator::persistEngineState() {
  EngineStateRecord record;
  record.risk = risk_.state();
  {
    std::lock_guard lock(context_mutex_);
    record.balance = context_.balance;
    record.daily_realized_pnl = context_.daily_realized_pnl;
    record.total_realized_pnl = context_.total_realized_pnl;
  }
  store_.saveEngineState(record);
}

void CycleOrchestrator::persistPosition(domain::PositionId id) {
  const auto pos = ledger_.position(id);
  if (!pos.has_value()) {
    return;
  }
  store_.savePosition(*pos);
  notify(PositionUpdateEvent{*pos, clock_.now_ms()});
}

void CycleOrchestrator::notify(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[CycleOrchestrator] WARNING: notification subscriber "
                 "failed: "
              << e.what() << "\n";
  }
}

void CycleOrchestrator::publishStatus() {
  EngineStatusEvent event;
  event.state = state_.load();
  event.paused = paused_.load();
  {
    std::lock_guard lock(context_mutex_);
    event.balance = context_.balance;
    event.cycle_count = context_.cycle_count;
  }
  event.timestamp_ms = clock_.now_ms();
  notify(event);
}

EngineStatus CycleOrchestrator::status() const {
  EngineStatus s;
  s.symbol = config_.symbol;
  s.state = state_.load();
  s.paused = paused_.load();
  {
    // Balance and positions change together under book_mutex_.
    std::lock_guard book(book_mutex_);
    {
      std::lock_guard lock(context_mutex_);
      s.context = context_;
      s.last_cycle_ms = last_cycle_ms_;
      s.last_error = last_error_;
    }
    s.risk = risk_.state();
    s.open_positions = ledger_.openPositions();
  }
  s.sources = aggregator_.sources();
  return s;
}

void CycleOrchestrator::logCriticalSnapshot(const std::string& reason) const {
  const domain::RiskState r = risk_.state();
  EngineContext ctx;
  {
    std::lock_guard lock(context_mutex_);
    ctx = context_;
  }
  std::cerr << "[CycleOrchestrator] CRITICAL: " << reason << "\n"
            << "[CycleOrchestrator] CRITICAL: state snapshot:"
            << " starting_capital=" << r.starting_capital
            << " balance=" << ctx.balance
            << " daily_realized_pnl=" << ctx.daily_realized_pnl
            << " total_realized_pnl=" << ctx.total_realized_pnl
            << " daily_loss=" << r.daily_loss_percent << "%"
            << " total_loss=" << r.total_loss_percent << "%"
            << " locked=" << (r.locked ? "true" : "false")
            << " anchor_day=" << r.daily_anchor_day
            << " open_positions=" << ledger_.openPositions().size() << "\n";
}

}  // namespace autotrader
