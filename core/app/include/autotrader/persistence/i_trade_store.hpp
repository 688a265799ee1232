#pragma once

#include "autotrader/domain/position.hpp"
#include "autotrader/domain/risk_state.hpp"
#include "autotrader/domain/trade.hpp"

#include <optional>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// EngineStateRecord: everything besides positions needed to resume
// -----------------------------------------------------------------------------
struct EngineStateRecord {
  domain::RiskState risk;
  double balance{0.0};
  double daily_realized_pnl{0.0};
  double total_realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// ITradeStore: persistence collaborator
// -----------------------------------------------------------------------------
//
// @brief  Append-only trade journal, position snapshots, and the engine
//         state that must survive a restart (notably the kill-switch latch).
//
// @details
// savePosition() is called on every change of a position (open, revalue,
// close); loadOpenPositions() returns the latest snapshot of every position
// whose last recorded status is OPEN.
//
// All methods throw PersistenceError on I/O failure.
// -----------------------------------------------------------------------------
class ITradeStore {
 public:
  virtual ~ITradeStore() = default;

  virtual void saveTrade(const domain::Trade& trade) = 0;
  virtual void savePosition(const domain::Position& position) = 0;
  virtual std::vector<domain::Position> loadOpenPositions() = 0;
  virtual std::vector<domain::Trade> loadTrades() = 0;

  virtual void saveEngineState(const EngineStateRecord& state) = 0;
  virtual std::optional<EngineStateRecord> loadEngineState() = 0;
};

}  // namespace autotrader
