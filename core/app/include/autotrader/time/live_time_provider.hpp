#pragma once

#include "autotrader/time/i_time_provider.hpp"

namespace autotrader {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the executable. Tests inject SimulationTimeProvider instead.
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace autotrader
