#pragma once

#include "autotrader/domain/risk_state.hpp"

#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions over epoch milliseconds (what ITimeProvider
//         returns) and UTC day numbers.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

// -------------------------------------------------------------------------
// utc_day
// -------------------------------------------------------------------------
// @brief  Converts epoch milliseconds to the number of whole UTC days since
//         1970-01-01.
//
// @details
// Floors toward negative infinity so that timestamps before the epoch still
// map to a consistent day. Integer arithmetic only; no timezone database.
// -------------------------------------------------------------------------
inline domain::UtcDay utc_day(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace autotrader
