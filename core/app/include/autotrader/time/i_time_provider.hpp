#pragma once

#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// The orchestrator needs wall-clock time for two things: trade/position
// timestamps and the UTC day used by the daily-loss rollover. Reading the
// clock through this interface lets tests move the day forward without
// waiting for midnight:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the test or replay
//                              harness.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace autotrader
