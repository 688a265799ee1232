#pragma once

#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Responsibility: The directional opinion carried by a Signal.
// HOLD is both "no opinion" and the safe fallback for ties and
// low-conviction results.
// -----------------------------------------------------------------------------
enum class Direction {
  Buy,
  Sell,
  Hold,
};

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
//
// @brief  Immutable output of one analysis module (or of the aggregator).
//
// @details
// Produced fresh each cycle, never mutated, discarded after aggregation.
// confidence is on a 0..100 scale; use makeSignal() to build one with the
// range enforced.
//
// Thread model:
//   Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Signal {
  Direction direction{Direction::Hold};
  double confidence{0.0};  // 0..100
  std::string rationale;   // Human-readable, shown on dashboards and in audit
};

// -----------------------------------------------------------------------------
// makeSignal(direction, confidence, rationale)
// -----------------------------------------------------------------------------
// @brief  Builds a Signal after checking that confidence lies in [0, 100].
//
// @throws std::invalid_argument if confidence is out of range or NaN.
// -----------------------------------------------------------------------------
Signal makeSignal(Direction direction, double confidence,
                  std::string rationale);

// -----------------------------------------------------------------------------
// WeightedOpinion
// -----------------------------------------------------------------------------
//
// @brief  One registry entry as seen by the aggregator for a single cycle:
//         the source's name, its operator-set weight and enabled flag, and
//         the Signal it produced this cycle.
//
// @details
// The registry keeps weight/enabled; the aggregator copies them into a
// WeightedOpinion at the start of a cycle so operator changes made mid-cycle
// never affect a combination already in progress.
// -----------------------------------------------------------------------------
struct WeightedOpinion {
  std::string source_name;
  double weight{0.0};  // 0..1
  Signal signal;
  bool enabled{true};
};

const char* directionToString(Direction d);

}  // namespace domain
}  // namespace autotrader
