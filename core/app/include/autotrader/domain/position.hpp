#pragma once

#include <cstdint>
#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// PositionId
// -----------------------------------------------------------------------------
// Ledger-assigned identifier. 0 is reserved as "unset".
// -----------------------------------------------------------------------------
using PositionId = std::uint64_t;

enum class PositionStatus {
  Open,
  Closed,
};

// -----------------------------------------------------------------------------
// Position: one long position in a single instrument
// -----------------------------------------------------------------------------
//
// @brief  Entry, size, protective stop and live valuation of a position.
//
// @details
// Lifecycle:
//   Created Open by PositionLedger::open() after a buy confirmation.
//   Revalued every cycle: current_price and unrealized_pnl change in place.
//   Closed exactly once by PositionLedger::close(), either on a SELL signal
//   or a stop-loss breach.
//   stop_order_id names the protective order resting on the venue; empty
//   when none was placed. It must be canceled when the position closes. At that point unrealized_pnl is frozen and holds
//   the realized P&L; the record never changes again.
//
// P&L is long-only: (price - entry_price) * amount.
//
// Thread model:
//   The authoritative copy lives inside PositionLedger and is written only
//   by the orchestrator thread. Everyone else receives copies.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  std::string symbol;
  double entry_price{0.0};
  double amount{0.0};              // Base-currency units
  double stop_loss_price{0.0};
  double current_price{0.0};
  double unrealized_pnl{0.0};      // Realized P&L once status == Closed
  PositionStatus status{PositionStatus::Open};
  std::int64_t entry_time_ms{0};   // Epoch milliseconds
  std::string stop_order_id;
};

const char* positionStatusToString(PositionStatus s);

}  // namespace domain
}  // namespace autotrader
