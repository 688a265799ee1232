#pragma once

#include "autotrader/concurrent/id_generator.hpp"
#include "autotrader/domain/position.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// PositionLedger: long-only position book with P&L and stop-loss detection
// -----------------------------------------------------------------------------
//
// @brief  Opens, revalues and closes positions, and reports positions whose
//         price has fallen to or below their stop-loss level.
//
// @details
// P&L math (long only):
//   revalue  pnl = (current_price - entry_price) * amount
//   close    pnl = (exit_price    - entry_price) * amount
//
// Invariants:
//   - At most one OPEN position per symbol. open() throws std::logic_error
//     otherwise; the orchestrator checks hasOpenPosition() first.
//   - A position moves to CLOSED exactly once. close() on a closed position
//     returns std::nullopt and changes nothing; revalue() on a closed
//     position returns its frozen P&L without touching it.
//
// Thread model:
//   The orchestrator thread is the only writer. Readers on other threads
//   (control server STATUS) use openPositions()/position(), which return
//   copies under a shared_lock, so they always see whole positions.
//
// Ownership:
//   Owns every Position it created or hydrated, open and closed.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger() = default;

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // open(symbol, entry_price, amount, stop_loss_price, entry_time_ms)
  // -------------------------------------------------------------------------
  // @return Copy of the new OPEN position (current_price = entry_price,
  //         unrealized_pnl = 0).
  //
  // @throws std::logic_error       if the symbol already has an open position.
  // @throws std::invalid_argument  if price or amount is not positive.
  // -------------------------------------------------------------------------
  domain::Position open(const std::string& symbol, double entry_price,
                        double amount, double stop_loss_price,
                        std::int64_t entry_time_ms = 0);

  // -------------------------------------------------------------------------
  // revalue(id, current_price)
  // -------------------------------------------------------------------------
  // @return Unrealized P&L after the update.
  // @throws std::out_of_range for an unknown id.
  // -------------------------------------------------------------------------
  double revalue(domain::PositionId id, double current_price);

  // -------------------------------------------------------------------------
  // close(id, exit_price)
  // -------------------------------------------------------------------------
  // @return Realized P&L, or std::nullopt if the position was already
  //         closed (nothing is recomputed).
  // @throws std::out_of_range for an unknown id.
  // -------------------------------------------------------------------------
  std::optional<double> close(domain::PositionId id, double exit_price);

  // Records the protective order placed for an open position.
  // @throws std::out_of_range for an unknown id.
  void attachStopOrder(domain::PositionId id, const std::string& order_id);

  std::vector<domain::Position> openPositions() const;

  // Copy of the position, or std::nullopt for an unknown id.
  std::optional<domain::Position> position(domain::PositionId id) const;

  std::optional<domain::Position> openPositionFor(
      const std::string& symbol) const;

  bool hasOpenPosition(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // checkStopLossBreaches(price_by_symbol)
  // -------------------------------------------------------------------------
  // @brief  Every open position whose symbol has a price in the map at or
  //         below its stop_loss_price. Symbols missing from the map are not
  //         breached. Does not modify the ledger.
  // -------------------------------------------------------------------------
  std::vector<domain::Position> checkStopLossBreaches(
      const std::unordered_map<std::string, double>& price_by_symbol) const;

  // Total unrealized P&L of open positions at their last revaluation.
  double unrealizedPnl() const;

  // -------------------------------------------------------------------------
  // hydrate(position)
  // -------------------------------------------------------------------------
  // @brief  Reinstates a persisted OPEN position on restart, keeping its id.
  //
  // @details
  // Future ids are guaranteed to be greater than every hydrated id.
  // @throws std::logic_error on a duplicate id or a second open position for
  //         the same symbol, std::invalid_argument for a closed position.
  // -------------------------------------------------------------------------
  void hydrate(const domain::Position& position);

 private:
  domain::Position& lookup(domain::PositionId id);

  mutable std::shared_mutex mutex_;
  std::map<domain::PositionId, domain::Position> positions_;  // id order
  IdGenerator ids_;
};

}  // namespace autotrader
