#pragma once

#include "autotrader/strategy/i_analysis_module.hpp"

#include <cstddef>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// MovingAverageCrossStrategy: reference analysis module
// -----------------------------------------------------------------------------
//
// @brief  Compares a short and a long simple moving average over the
//         snapshot's recent price series.
//
// @details
//   short > long  -> BUY
//   short < long  -> SELL
//   equal         -> HOLD, confidence 50
//   fewer points than long_window -> HOLD, confidence 0
//
// Confidence for BUY/SELL is 50 plus `points_per_percent` for every percent
// the short average sits away from the long one, capped at 100.
// -----------------------------------------------------------------------------
class MovingAverageCrossStrategy final : public IAnalysisModule {
 public:
  static constexpr const char* kName = "moving_average_cross";

  // @throws std::invalid_argument unless 0 < short_window < long_window and
  //         points_per_percent >= 0.
  MovingAverageCrossStrategy(std::size_t short_window = 10,
                             std::size_t long_window = 30,
                             double points_per_percent = 10.0);

  std::string name() const override { return kName; }

  domain::Signal evaluate(const domain::MarketSnapshot& snapshot) override;

 private:
  std::size_t short_window_;
  std::size_t long_window_;
  double points_per_percent_;
};

}  // namespace autotrader
