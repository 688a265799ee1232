#pragma once

#include <cstdint>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// UtcDay
// -----------------------------------------------------------------------------
// Days since 1970-01-01 (UTC). Two timestamps fall on the same trading day
// iff their UtcDay values are equal.
// -----------------------------------------------------------------------------
using UtcDay = std::int64_t;

// -----------------------------------------------------------------------------
// RiskState: persistent state of the Risk Governor
// -----------------------------------------------------------------------------
//
// @brief  The kill-switch latch and daily-loss bookkeeping owned by
//         RiskGovernor.
//
// @details
//   locked            one-way latch set only by a kill-switch trip. Cleared
//                     only by an explicit reset. Survives restart through the
//                     persistence collaborator.
//   daily_anchor_day  the UTC day the daily figures refer to. Advanced only
//                     by RiskGovernor::rolloverIfNewDay().
//
// Thread model:
//   Single writer (the orchestrator thread). Readers get copies.
// -----------------------------------------------------------------------------
struct RiskState {
  double starting_capital{0.0};
  double daily_loss_percent{0.0};
  double total_loss_percent{0.0};
  bool locked{false};
  UtcDay daily_anchor_day{0};
};

}  // namespace domain
}  // namespace autotrader
