#pragma once

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// EngineState: orchestrator lifecycle
// -----------------------------------------------------------------------------
//
// @details
//   Idle     constructed or stopped; no loop running.
//   Running  the cycle loop is active (possibly paused; paused is a separate
//            flag because revaluation and stop-loss monitoring continue).
//   Halted   the kill switch tripped. Terminal for the running loop; only an
//            explicit kill-switch reset returns the orchestrator to Idle.
// -----------------------------------------------------------------------------
enum class EngineState {
  Idle,
  Running,
  Halted,
};

inline const char* engineStateToString(EngineState s) {
  switch (s) {
    case EngineState::Idle:    return "IDLE";
    case EngineState::Running: return "RUNNING";
    case EngineState::Halted:  return "HALTED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace autotrader
