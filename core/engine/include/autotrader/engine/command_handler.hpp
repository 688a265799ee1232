#pragma once

#include "autotrader/engine/cycle_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// executeCommand(orchestrator, command)
// -----------------------------------------------------------------------------
//
// @brief  Interprets one operator command line and returns a JSON reply.
//
// @details
// Commands (case-sensitive verb, whitespace-separated arguments):
//   PING                      {"status":"ok","response":"PONG"}
//   STATUS                    {"status":"ok", ...statusToJson()}
//   PAUSE | RESUME | CLOSE_ALL | RESET_KILL_SWITCH | STOP
//   SET_WEIGHT <name> <w>     w in [0, 1]
//   ENABLE <name> | DISABLE <name>
//
// Every reply carries "status": "ok" or "error"; errors add "message".
// Commands that act at the next cycle boundary say so in "message".
//
// Thread model: Called on the control server thread. Uses only the
// thread-safe orchestrator entry points.
// -----------------------------------------------------------------------------
std::string executeCommand(CycleOrchestrator& orchestrator,
                           const std::string& command);

// JSON rendering of EngineStatus shared by STATUS replies and logs.
nlohmann::json statusToJson(const EngineStatus& status);

}  // namespace autotrader
