#pragma once

#include "autotrader/domain/risk_limits.hpp"
#include "autotrader/domain/risk_state.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace autotrader {

// -----------------------------------------------------------------------------
// ValidationResult: outcome of a pre-trade check
// -----------------------------------------------------------------------------
// A rejection is an expected outcome, never an exception. reason is
// human-readable and empty when approved.
// -----------------------------------------------------------------------------
struct ValidationResult {
  bool approved{false};
  std::string reason;

  static ValidationResult approve() { return ValidationResult{true, {}}; }
  static ValidationResult reject(std::string why) {
    return ValidationResult{false, std::move(why)};
  }
};

// -----------------------------------------------------------------------------
// RiskGovernor: capital-preservation gate and kill-switch latch
// -----------------------------------------------------------------------------
//
// @brief  Sizes positions, approves or rejects prospective entries, and owns
//         the daily-loss and kill-switch state machine.
//
// @details
// Two independent loss controls:
//
//   Daily loss limit  Self-healing. validate() rejects while the daily loss
//                     is at or above the limit; rolloverIfNewDay() zeroes
//                     the daily figure when the UTC day changes.
//
//   Kill switch       One-way latch. checkKillSwitch() sets `locked` when the
//                     total loss reaches the threshold. Only
//                     resetKillSwitch() clears it. Day rollover never does.
//
// validate() precedence:
//   1. locked                                -> "trading locked by kill switch"
//   2. daily_loss_percent >= daily limit     -> "daily loss limit reached (x%)"
//   3. sizePosition(balance) < kMinPositionUsd
//                       -> "insufficient balance for minimum position size"
//
// Thread model:
//   The orchestrator thread is the only writer. state() may be called from
//   the control server thread and returns a consistent copy; every method
//   takes the internal mutex for a short critical section.
//
// Ownership:
//   Owns RiskState exclusively. Persisting it is the orchestrator's job
//   (state() / hydrate()).
// -----------------------------------------------------------------------------
class RiskGovernor {
 public:
  static constexpr double kMinPositionUsd = 10.0;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  limits      Sizing and loss thresholds (copied).
  // @param  anchor_day  UTC day the daily loss figure starts counting from.
  // -------------------------------------------------------------------------
  RiskGovernor(const domain::RiskLimits& limits, domain::UtcDay anchor_day);

  RiskGovernor(const RiskGovernor&) = delete;
  RiskGovernor& operator=(const RiskGovernor&) = delete;
  RiskGovernor(RiskGovernor&&) = delete;
  RiskGovernor& operator=(RiskGovernor&&) = delete;

  // balance * position_size_percent / 100, regardless of any other state.
  double sizePosition(double balance) const;

  ValidationResult validate(double balance, double daily_loss_percent) const;

  // -------------------------------------------------------------------------
  // checkKillSwitch(total_loss_percent)
  // -------------------------------------------------------------------------
  // @return true if trading is locked after the call.
  //
  // @details
  // Latches when total_loss_percent >= kill_switch_percent. Idempotent: once
  // locked, returns true for any input until resetKillSwitch().
  // -------------------------------------------------------------------------
  bool checkKillSwitch(double total_loss_percent);

  // -------------------------------------------------------------------------
  // rolloverIfNewDay(today)
  // -------------------------------------------------------------------------
  // @return true if the anchor moved and the daily loss was reset.
  //
  // @details
  // Any day different from the anchor counts, including a clock that moved
  // backwards. `locked` is never touched.
  // -------------------------------------------------------------------------
  bool rolloverIfNewDay(domain::UtcDay today);

  // Stores the latest loss figures computed by the orchestrator.
  void recordLoss(double daily_loss_percent, double total_loss_percent);

  void resetKillSwitch();

  bool locked() const;
  domain::RiskState state() const;
  const domain::RiskLimits& limits() const { return limits_; }

  // Restores persisted state on restart. starting_capital stays the
  // configured one.
  void hydrate(const domain::RiskState& persisted);

 private:
  const domain::RiskLimits limits_;

  mutable std::mutex mutex_;
  domain::RiskState state_;
};

}  // namespace autotrader
