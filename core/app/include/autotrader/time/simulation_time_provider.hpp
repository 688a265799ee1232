#pragma once

#include "autotrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// Used by tests and replay harnesses to control which UTC day the
// orchestrator believes it is. Advancing the clock across midnight is how
// the daily-loss rollover is exercised without waiting for a real day to
// pass.
//
// Internal storage is a std::atomic<int64_t>, so a harness thread may
// advance the clock while the orchestrator thread reads it.
//
// Thread model:
//   advance_time() from one writer; now_ms() from any number of readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at the given epoch milliseconds.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility; setting an earlier time is
  // allowed and is occasionally useful in tests.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace autotrader
