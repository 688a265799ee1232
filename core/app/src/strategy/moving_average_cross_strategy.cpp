#include "autotrader/strategy/moving_average_cross_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace autotrader {

namespace {

// Mean of the last `window` prices. Caller guarantees series.size() >= window.
double tailMean(const std::vector<domain::PricePoint>& series,
                std::size_t window) {
  double sum = 0.0;
  for (auto it = series.end() - static_cast<std::ptrdiff_t>(window);
       it != series.end(); ++it) {
    sum += it->price;
  }
  return sum / static_cast<double>(window);
}

}  // namespace

MovingAverageCrossStrategy::MovingAverageCrossStrategy(
    std::size_t short_window, std::size_t long_window,
    double points_per_percent)
    : short_window_(short_window),
      long_window_(long_window),
      points_per_percent_(points_per_percent) {
  if (short_window_ == 0 || short_window_ >= long_window_) {
    throw std::invalid_argument(
        "moving average windows must satisfy 0 < short < long");
  }
  if (!(points_per_percent_ >= 0.0)) {
    throw std::invalid_argument("points_per_percent must be non-negative");
  }
}

domain::Signal MovingAverageCrossStrategy::evaluate(
    const domain::MarketSnapshot& snapshot) {
  const auto& series = snapshot.recent_series;
  if (series.size() < long_window_) {
    std::ostringstream msg;
    msg << "insufficient data (" << series.size() << "/" << long_window_
        << " points)";
    return domain::makeSignal(domain::Direction::Hold, 0.0, msg.str());
  }

  const double short_ma = tailMean(series, short_window_);
  const double long_ma = tailMean(series, long_window_);

  std::ostringstream msg;
  msg.precision(2);
  msg << std::fixed << "SMA" << short_window_ << "=" << short_ma << " SMA"
      << long_window_ << "=" << long_ma;

  if (short_ma == long_ma || long_ma <= 0.0) {
    return domain::makeSignal(domain::Direction::Hold, 50.0, msg.str());
  }

  const double spread_percent = std::abs(short_ma - long_ma) / long_ma * 100.0;
  const double confidence =
      std::min(100.0, 50.0 + spread_percent * points_per_percent_);

  if (short_ma > long_ma) {
    msg << " bullish crossover";
    return domain::makeSignal(domain::Direction::Buy, confidence, msg.str());
  }
  msg << " bearish crossover";
  return domain::makeSignal(domain::Direction::Sell, confidence, msg.str());
}

}  // namespace autotrader
