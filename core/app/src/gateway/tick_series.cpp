#include "autotrader/gateway/tick_series.hpp"

#include <stdexcept>

namespace autotrader {

TickSeries::TickSeries(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("tick series capacity must be at least 1");
  }
}

bool TickSeries::append(const std::string& symbol,
                        const domain::PricePoint& point) {
  auto& points = points_[symbol];
  if (!points.empty() && point.timestamp_ms < points.back().timestamp_ms) {
    return false;
  }
  points.push_back(point);
  while (points.size() > capacity_) {
    points.pop_front();
  }
  return true;
}

std::optional<domain::PricePoint> TickSeries::latest(
    const std::string& symbol) const {
  auto it = points_.find(symbol);
  if (it == points_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

std::vector<domain::PricePoint> TickSeries::series(
    const std::string& symbol) const {
  auto it = points_.find(symbol);
  if (it == points_.end()) {
    return {};
  }
  return std::vector<domain::PricePoint>(it->second.begin(), it->second.end());
}

std::size_t TickSeries::size(const std::string& symbol) const {
  auto it = points_.find(symbol);
  return it == points_.end() ? 0 : it->second.size();
}

}  // namespace autotrader
