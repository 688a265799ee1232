#pragma once

#include "autotrader/domain/engine_state.hpp"

#include <cstdint>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// Responsibility: Informs listeners that the Risk Governor declined a
// prospective entry or exit this cycle.
// Why in architecture: Rejections are expected outcomes, not errors. They
// are logged at info level and published so a dashboard can show why the
// engine is not trading without scraping logs.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  std::string symbol;
  std::string reason;           // Human-readable, suitable for display
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// EngineStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Heartbeat published at the end of every cycle and on every
// state transition (start, pause, resume, halt, stop).
// -----------------------------------------------------------------------------
struct EngineStatusEvent {
  domain::EngineState state{domain::EngineState::Idle};
  bool paused{false};
  double balance{0.0};
  std::uint64_t cycle_count{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace autotrader
