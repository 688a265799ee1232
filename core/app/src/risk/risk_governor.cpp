#include "autotrader/risk/risk_governor.hpp"

#include <iostream>
#include <sstream>

namespace autotrader {

RiskGovernor::RiskGovernor(const domain::RiskLimits& limits,
                           domain::UtcDay anchor_day)
    : limits_(limits) {
  state_.starting_capital = limits_.starting_capital;
  state_.daily_anchor_day = anchor_day;
}

double RiskGovernor::sizePosition(double balance) const {
  return balance * limits_.position_size_percent / 100.0;
}

// -----------------------------------------------------------------------------
// validate(): precedence is lock, daily limit, minimum size
// -----------------------------------------------------------------------------
ValidationResult RiskGovernor::validate(double balance,
                                        double daily_loss_percent) const {
  {
    std::lock_guard lock(mutex_);
    if (state_.locked) {
      return ValidationResult::reject("trading locked by kill switch");
    }
  }

  if (daily_loss_percent >= limits_.daily_loss_limit_percent) {
    std::ostringstream reason;
    reason.precision(2);
    reason << std::fixed << "daily loss limit reached (" << daily_loss_percent
           << "% >= " << limits_.daily_loss_limit_percent << "%)";
    return ValidationResult::reject(reason.str());
  }

  if (sizePosition(balance) < kMinPositionUsd) {
    return ValidationResult::reject(
        "insufficient balance for minimum position size");
  }

  return ValidationResult::approve();
}

// -----------------------------------------------------------------------------
// checkKillSwitch(): the only path that sets `locked`
// -----------------------------------------------------------------------------
bool RiskGovernor::checkKillSwitch(double total_loss_percent) {
  std::lock_guard lock(mutex_);
  state_.total_loss_percent = total_loss_percent;
  if (state_.locked) {
    return true;
  }
  if (total_loss_percent >= limits_.kill_switch_percent) {
    state_.locked = true;
    std::cerr << "[RiskGovernor] CRITICAL: kill switch latched. total loss "
              << total_loss_percent << "% >= " << limits_.kill_switch_percent
              << "%\n";
    return true;
  }
  return false;
}

bool RiskGovernor::rolloverIfNewDay(domain::UtcDay today) {
  std::lock_guard lock(mutex_);
  if (today == state_.daily_anchor_day) {
    return false;
  }
  std::cout << "[RiskGovernor] UTC day rollover " << state_.daily_anchor_day
            << " -> " << today << ", daily loss reset (was "
            << state_.daily_loss_percent << "%)\n";
  state_.daily_loss_percent = 0.0;
  state_.daily_anchor_day = today;
  return true;
}

void RiskGovernor::recordLoss(double daily_loss_percent,
                              double total_loss_percent) {
  std::lock_guard lock(mutex_);
  state_.daily_loss_percent = daily_loss_percent;
  state_.total_loss_percent = total_loss_percent;
}

void RiskGovernor::resetKillSwitch() {
  std::lock_guard lock(mutex_);
  if (state_.locked) {
    std::cout << "[RiskGovernor] kill switch reset by operator\n";
  }
  state_.locked = false;
}

bool RiskGovernor::locked() const {
  std::lock_guard lock(mutex_);
  return state_.locked;
}

domain::RiskState RiskGovernor::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void RiskGovernor::hydrate(const domain::RiskState& persisted) {
  std::lock_guard lock(mutex_);
  state_.daily_loss_percent = persisted.daily_loss_percent;
  state_.total_loss_percent = persisted.total_loss_percent;
  state_.locked = persisted.locked;
  state_.daily_anchor_day = persisted.daily_anchor_day;
  if (state_.locked) {
    std::cerr << "[RiskGovernor] WARNING: restored a latched kill switch. "
                 "Trading stays locked until reset.\n";
  }
}

}  // namespace autotrader
