#pragma once

#include "autotrader/domain/market_snapshot.hpp"
#include "autotrader/domain/signal.hpp"
#include "autotrader/strategy/i_analysis_module.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// SourceInfo: read-only view of one registry entry (for STATUS replies)
// -----------------------------------------------------------------------------
struct SourceInfo {
  std::string name;
  double weight{0.0};
  bool enabled{true};
};

// -----------------------------------------------------------------------------
// AggregationResult: combined decision plus the inputs that produced it
// -----------------------------------------------------------------------------
// opinions holds every registered source in registration order, with
// enabled == false for sources that were disabled or failed this cycle. The
// orchestrator archives the enabled ones as the trade's signal snapshot.
// -----------------------------------------------------------------------------
struct AggregationResult {
  domain::Signal combined;
  std::vector<domain::WeightedOpinion> opinions;
};

// -----------------------------------------------------------------------------
// SignalAggregator: weighted vote over registered analysis modules
// -----------------------------------------------------------------------------
//
// @brief  Keeps the registry of analysis modules with their operator-tunable
//         weight and enabled flag, evaluates them once per cycle and combines
//         their opinions into a single Signal.
//
// @details
// Combination rule (see combine()):
//   - each enabled source adds confidence * weight to the bucket of its
//     direction (BUY, SELL, HOLD);
//   - the strictly largest bucket wins, any tie resolves to HOLD;
//   - a winning BUY or SELL below the confidence threshold is downgraded to
//     HOLD, keeping the score as confidence;
//   - rationale is "name: rationale" per contributing source, in
//     registration order, joined by " | ".
//
// Source failures: an exception from evaluate() or a signal whose
// confidence is outside [0, 100] is logged as a warning and the source sits
// out that cycle. It is never propagated.
//
// Thread model:
//   The orchestrator thread calls evaluate(). The control server thread
//   calls setWeight/enable/disable/sources. The registry is guarded by a
//   mutex; evaluate() copies it under the lock and runs the modules without
//   it, so a weight change lands at the next cycle, never mid-cycle.
//
// Ownership:
//   Shares ownership of registered modules (std::shared_ptr) so a copied
//   registry entry stays valid while a module runs.
// -----------------------------------------------------------------------------
class SignalAggregator {
 public:
  explicit SignalAggregator(double confidence_threshold);

  SignalAggregator(const SignalAggregator&) = delete;
  SignalAggregator& operator=(const SignalAggregator&) = delete;
  SignalAggregator(SignalAggregator&&) = delete;
  SignalAggregator& operator=(SignalAggregator&&) = delete;

  // -------------------------------------------------------------------------
  // registerSource(module, weight, enabled)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument on a null module, a duplicate name or a
  //         weight outside [0, 1].
  // -------------------------------------------------------------------------
  void registerSource(std::shared_ptr<IAnalysisModule> module, double weight,
                      bool enabled = true);

  // Registry mutators. Return false when no source has that name.
  // setWeight throws std::invalid_argument for a weight outside [0, 1].
  bool setWeight(const std::string& name, double weight);
  bool enable(const std::string& name);
  bool disable(const std::string& name);

  std::vector<SourceInfo> sources() const;

  double confidenceThreshold() const { return confidence_threshold_; }

  // -------------------------------------------------------------------------
  // evaluate(snapshot)
  // -------------------------------------------------------------------------
  // @brief  Runs every enabled module on the snapshot and combines the
  //         results.
  // -------------------------------------------------------------------------
  AggregationResult evaluate(const domain::MarketSnapshot& snapshot);

  // -------------------------------------------------------------------------
  // combine(opinions, threshold)
  // -------------------------------------------------------------------------
  // @brief  Pure combination step. Disabled opinions are ignored; with no
  //         enabled opinion the result is HOLD, 0, "no active sources".
  //         The combined confidence is capped at 100.
  // -------------------------------------------------------------------------
  static domain::Signal combine(
      const std::vector<domain::WeightedOpinion>& opinions,
      double confidence_threshold);

 private:
  struct Entry {
    std::shared_ptr<IAnalysisModule> module;
    std::string name;
    double weight{0.0};
    bool enabled{true};
  };

  Entry* find(const std::string& name);

  const double confidence_threshold_;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;  // Registration order
};

}  // namespace autotrader
