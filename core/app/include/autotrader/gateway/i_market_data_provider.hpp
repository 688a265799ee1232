#pragma once

#include "autotrader/domain/market_snapshot.hpp"

#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// IMarketDataProvider: source of per-cycle market snapshots
// -----------------------------------------------------------------------------
// fetchSnapshot() returns the latest price plus the recent series the
// analysis modules work on. It throws MarketDataError when no usable data
// exists; the orchestrator treats that as a transient failure.
// -----------------------------------------------------------------------------
class IMarketDataProvider {
 public:
  virtual ~IMarketDataProvider() = default;

  virtual domain::MarketSnapshot fetchSnapshot(const std::string& symbol) = 0;
};

}  // namespace autotrader
