#pragma once

#include "autotrader/domain/order.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/domain/signal.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// SignalSnapshot
// -----------------------------------------------------------------------------
// Audit copy of one source's contribution to the decision that produced a
// trade. Only sources that actually contributed that cycle appear.
// -----------------------------------------------------------------------------
struct SignalSnapshot {
  std::string source_name;
  Direction direction{Direction::Hold};
  double confidence{0.0};
  double weight{0.0};
};

// -----------------------------------------------------------------------------
// Trade: append-only audit record
// -----------------------------------------------------------------------------
//
// @brief  One record per executed market order.
//
// @details
// A BUY record carries the entry price; a SELL record (signal exit,
// stop-loss exit, operator close-all or kill-switch liquidation) carries
// both the entry and exit prices and the realized P&L. Records are written
// once to the persistence collaborator and never mutated.
//
// rationale is the human-readable reason shown to operators, e.g. the
// aggregator's combined rationale or "Stop-loss triggered at 47000.00".
// -----------------------------------------------------------------------------
struct Trade {
  std::string symbol;
  Side side{Side::Buy};
  double amount{0.0};
  double entry_price{0.0};
  std::optional<double> exit_price;
  std::optional<double> realized_pnl;
  std::vector<SignalSnapshot> signal_snapshot;
  std::string rationale;
  std::int64_t timestamp_ms{0};
  PositionId position_id{0};
  std::string order_id;
  bool simulated{false};
};

}  // namespace domain
}  // namespace autotrader
