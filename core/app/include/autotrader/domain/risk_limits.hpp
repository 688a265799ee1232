#pragma once

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: capital-preservation thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters consumed by RiskGovernor
//         and by the orchestrator's entry logic.
//
// @details
// All percentages are on a 0..100 scale. They are loaded from the engine
// configuration (see EngineConfig) and copied into components at
// construction time.
//
//   position_size_percent    share of the available balance committed to a
//                            new position.
//   daily_loss_limit_percent realized loss for the current UTC day, relative
//                            to starting capital, at which new entries stop
//                            until the next day.
//   kill_switch_percent      cumulative loss relative to starting capital at
//                            which trading is latched off until an operator
//                            resets it.
//   stop_loss_percent        distance of the protective stop below the entry
//                            price.
//
// Thread model:
//   Plain data, value semantics.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double position_size_percent{5.0};
  double daily_loss_limit_percent{15.0};
  double kill_switch_percent{50.0};
  double starting_capital{10000.0};
  double stop_loss_percent{5.0};
};

}  // namespace domain
}  // namespace autotrader
