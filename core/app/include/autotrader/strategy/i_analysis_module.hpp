#pragma once

#include "autotrader/domain/market_snapshot.hpp"
#include "autotrader/domain/signal.hpp"

#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// IAnalysisModule: pluggable source of directional opinions
// -----------------------------------------------------------------------------
//
// @brief  One method, evaluate(snapshot) -> Signal. Technical indicators,
//         sentiment scorers and anything else that forms an opinion about
//         the market implement this interface and are registered with the
//         SignalAggregator.
//
// @details
// Weight and enabled state belong to the aggregator's registry, not to the
// module, so operators can retune sources without the module's knowledge.
//
// evaluate() may throw; the aggregator treats a throwing module as disabled
// for that cycle only.
//
// Thread model: evaluate() is called on the orchestrator thread, once per
// cycle. Implementations need no internal locking unless they share state
// with another thread themselves.
// -----------------------------------------------------------------------------
class IAnalysisModule {
 public:
  virtual ~IAnalysisModule() = default;

  // Unique registry key, also used to tag the module's rationale.
  virtual std::string name() const = 0;

  virtual domain::Signal evaluate(const domain::MarketSnapshot& snapshot) = 0;
};

}  // namespace autotrader
