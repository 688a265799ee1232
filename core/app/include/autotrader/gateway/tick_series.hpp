#pragma once

#include "autotrader/domain/market_snapshot.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// TickSeries: bounded rolling price history per symbol
// -----------------------------------------------------------------------------
//
// @brief  Keeps the most recent `capacity` points for every symbol seen.
//
// @details
// Points are stored in arrival order. A tick older than the newest stored
// point for its symbol is dropped, so the series stays time-ordered even if
// the feed replays. Not thread-safe; owned by a single provider thread.
// -----------------------------------------------------------------------------
class TickSeries {
 public:
  explicit TickSeries(std::size_t capacity);

  // @return false if the point was dropped as out of order.
  bool append(const std::string& symbol, const domain::PricePoint& point);

  std::optional<domain::PricePoint> latest(const std::string& symbol) const;

  // Oldest first. Empty for an unknown symbol.
  std::vector<domain::PricePoint> series(const std::string& symbol) const;

  std::size_t size(const std::string& symbol) const;
  std::size_t capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  std::unordered_map<std::string, std::deque<domain::PricePoint>> points_;
};

}  // namespace autotrader
