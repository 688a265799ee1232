#pragma once

#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// EngineContext: account figures owned by the orchestrator
// -----------------------------------------------------------------------------
// balance             cash available for new entries (quote currency)
// daily_realized_pnl  realized P&L since the current UTC day began
// total_realized_pnl  realized P&L since the account started
// cycle_count         cycles run by this process
// -----------------------------------------------------------------------------
struct EngineContext {
  double balance{0.0};
  double daily_realized_pnl{0.0};
  double total_realized_pnl{0.0};
  std::uint64_t cycle_count{0};
};

}  // namespace autotrader
