#pragma once

#include "autotrader/domain/position.hpp"

#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Carries a snapshot of a Position after it was opened, revalued or
//         closed by the PositionLedger.
//
// @details
// The position field is a full copy, not a reference, so the event stays
// valid after publication regardless of what happens to the ledger.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

}  // namespace autotrader
