#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace autotrader {
namespace domain {

// One observation in a snapshot's recent series, oldest first.
struct PricePoint {
  std::int64_t timestamp_ms{0};
  double price{0.0};
  double volume{0.0};
};

// -----------------------------------------------------------------------------
// MarketSnapshot
// -----------------------------------------------------------------------------
//
// @brief  What the Market Data Provider returns for one cycle: the latest
//         price plus an indicator-ready recent series.
//
// @details
// price always equals recent_series.back().price when the series is
// non-empty. Analysis modules read only this struct; they never talk to the
// feed themselves.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string symbol;
  double price{0.0};
  std::int64_t timestamp_ms{0};
  std::vector<PricePoint> recent_series;
};

}  // namespace domain
}  // namespace autotrader
