#include "autotrader/risk/position_ledger.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

namespace autotrader {

// -----------------------------------------------------------------------------
// open(): enforce one open position per symbol
// -----------------------------------------------------------------------------
domain::Position PositionLedger::open(const std::string& symbol,
                                      double entry_price, double amount,
                                      double stop_loss_price,
                                      std::int64_t entry_time_ms) {
  if (!(entry_price > 0.0) || !(amount > 0.0)) {
    throw std::invalid_argument(
        "position entry price and amount must be positive");
  }

  std::unique_lock lock(mutex_);
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol == symbol && pos.status == domain::PositionStatus::Open) {
      throw std::logic_error("position already open for " + symbol +
                             " (id " + std::to_string(id) + ")");
    }
  }

  domain::Position pos;
  pos.id = ids_.next_id();
  pos.symbol = symbol;
  pos.entry_price = entry_price;
  pos.amount = amount;
  pos.stop_loss_price = stop_loss_price;
  pos.current_price = entry_price;
  pos.unrealized_pnl = 0.0;
  pos.status = domain::PositionStatus::Open;
  pos.entry_time_ms = entry_time_ms;

  positions_.emplace(pos.id, pos);

  std::cout << "[PositionLedger] opened id=" << pos.id << " " << symbol
            << " amount=" << amount << " entry=" << entry_price
            << " stop=" << stop_loss_price << "\n";
  return pos;
}

double PositionLedger::revalue(domain::PositionId id, double current_price) {
  std::unique_lock lock(mutex_);
  domain::Position& pos = lookup(id);
  if (pos.status == domain::PositionStatus::Closed) {
    return pos.unrealized_pnl;
  }
  pos.current_price = current_price;
  pos.unrealized_pnl = (current_price - pos.entry_price) * pos.amount;
  return pos.unrealized_pnl;
}

// -----------------------------------------------------------------------------
// close(): the single write that freezes realized P&L
// -----------------------------------------------------------------------------
std::optional<double> PositionLedger::close(domain::PositionId id,
                                            double exit_price) {
  std::unique_lock lock(mutex_);
  domain::Position& pos = lookup(id);
  if (pos.status == domain::PositionStatus::Closed) {
    std::cerr << "[PositionLedger] WARNING: close ignored, position id=" << id
              << " already closed\n";
    return std::nullopt;
  }

  pos.current_price = exit_price;
  pos.unrealized_pnl = (exit_price - pos.entry_price) * pos.amount;
  pos.status = domain::PositionStatus::Closed;

  std::cout << "[PositionLedger] closed id=" << id << " " << pos.symbol
            << " exit=" << exit_price << " realized_pnl=" << pos.unrealized_pnl
            << "\n";
  return pos.unrealized_pnl;
}

void PositionLedger::attachStopOrder(domain::PositionId id,
                                     const std::string& order_id) {
  std::unique_lock lock(mutex_);
  lookup(id).stop_order_id = order_id;
}

std::vector<domain::Position> PositionLedger::openPositions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> out;
  for (const auto& [id, pos] : positions_) {
    if (pos.status == domain::PositionStatus::Open) {
      out.push_back(pos);
    }
  }
  return out;
}

std::optional<domain::Position> PositionLedger::position(
    domain::PositionId id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Position> PositionLedger::openPositionFor(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol == symbol && pos.status == domain::PositionStatus::Open) {
      return pos;
    }
  }
  return std::nullopt;
}

bool PositionLedger::hasOpenPosition(const std::string& symbol) const {
  return openPositionFor(symbol).has_value();
}

// -----------------------------------------------------------------------------
// checkStopLossBreaches(): long-only, price <= stop
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionLedger::checkStopLossBreaches(
    const std::unordered_map<std::string, double>& price_by_symbol) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> breached;
  for (const auto& [id, pos] : positions_) {
    if (pos.status != domain::PositionStatus::Open) {
      continue;
    }
    auto price = price_by_symbol.find(pos.symbol);
    if (price != price_by_symbol.end() && price->second <= pos.stop_loss_price) {
      breached.push_back(pos);
    }
  }
  return breached;
}

double PositionLedger::unrealizedPnl() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [id, pos] : positions_) {
    if (pos.status == domain::PositionStatus::Open) {
      total += pos.unrealized_pnl;
    }
  }
  return total;
}

// -----------------------------------------------------------------------------
// hydrate(): warm-up only, before the first cycle
// -----------------------------------------------------------------------------
void PositionLedger::hydrate(const domain::Position& position) {
  if (position.status != domain::PositionStatus::Open) {
    throw std::invalid_argument("only open positions can be hydrated");
  }

  std::unique_lock lock(mutex_);
  if (positions_.count(position.id) != 0) {
    throw std::logic_error("duplicate position id " +
                           std::to_string(position.id));
  }
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol == position.symbol &&
        pos.status == domain::PositionStatus::Open) {
      throw std::logic_error("position already open for " + position.symbol);
    }
  }

  positions_.emplace(position.id, position);
  ids_.advance_past(position.id);
}

domain::Position& PositionLedger::lookup(domain::PositionId id) {
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    throw std::out_of_range("unknown position id " + std::to_string(id));
  }
  return it->second;
}

}  // namespace autotrader
