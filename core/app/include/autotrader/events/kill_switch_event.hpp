#pragma once

#include "autotrader/domain/risk_state.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// KillSwitchEvent: notification that trading has been latched off
// -----------------------------------------------------------------------------
//
// @brief  Published by the orchestrator when RiskGovernor::checkKillSwitch()
//         trips.
//
// @details
// Carries enough context for an operator to understand the halt without
// reading logs:
//   - total_loss_percent: the cumulative loss that breached the threshold.
//   - threshold_percent:  the configured kill-switch level.
//   - risk_state:         full governor state at the moment of the trip.
//   - positions_closed:   how many positions the emergency liquidation
//                         closed successfully.
//   - positions_failed:   how many liquidation orders failed (those
//                         positions remain open on the venue and need manual
//                         attention).
//
// The halt is also persisted (RiskState::locked) so it survives restart.
// -----------------------------------------------------------------------------
struct KillSwitchEvent {
  double total_loss_percent{0.0};
  double threshold_percent{0.0};
  domain::RiskState risk_state;
  std::size_t positions_closed{0};
  std::size_t positions_failed{0};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

}  // namespace autotrader
