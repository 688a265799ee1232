#include "autotrader/engine/command_handler.hpp"
#include "autotrader/persistence/json_codec.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace autotrader {

namespace {

std::vector<std::string> tokenize(const std::string& command) {
  std::istringstream in(command);
  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

nlohmann::json ok(const std::string& message = {}) {
  nlohmann::json j{{"status", "ok"}};
  if (!message.empty()) {
    j["message"] = message;
  }
  return j;
}

nlohmann::json error(const std::string& message) {
  return {{"status", "error"}, {"message", message}};
}

nlohmann::json unknownSource(const std::string& name) {
  return error("unknown strategy '" + name + "'");
}

}  // namespace

nlohmann::json statusToJson(const EngineStatus& status) {
  nlohmann::json sources = nlohmann::json::array();
  for (const auto& s : status.sources) {
    sources.push_back(
        {{"name", s.name}, {"weight", s.weight}, {"enabled", s.enabled}});
  }

  return {{"symbol", status.symbol},
          {"state", domain::engineStateToString(status.state)},
          {"paused", status.paused},
          {"balance", status.context.balance},
          {"daily_realized_pnl", status.context.daily_realized_pnl},
          {"total_realized_pnl", status.context.total_realized_pnl},
          {"cycle_count", status.context.cycle_count},
          {"last_cycle_ms", status.last_cycle_ms},
          {"last_error", status.last_error},
          {"risk", status.risk},
          {"positions", status.open_positions},
          {"strategies", sources}};
}

// -----------------------------------------------------------------------------
// executeCommand(): parse verb, dispatch, render reply
// -----------------------------------------------------------------------------
std::string executeCommand(CycleOrchestrator& orchestrator,
                           const std::string& command) {
  const auto args = tokenize(command);
  nlohmann::json reply;

  if (args.empty()) {
    reply = error("empty command");
  } else if (args[0] == "PING") {
    reply = ok();
    reply["response"] = "PONG";
  } else if (args[0] == "STATUS") {
    reply = statusToJson(orchestrator.status());
    reply["status"] = "ok";
  } else if (args[0] == "PAUSE") {
    orchestrator.pause();
    reply = ok("pause takes effect at the next cycle");
  } else if (args[0] == "RESUME") {
    orchestrator.resume();
    reply = ok("resume takes effect at the next cycle");
  } else if (args[0] == "CLOSE_ALL") {
    orchestrator.closeAll();
    reply = ok("positions close at the next cycle");
  } else if (args[0] == "RESET_KILL_SWITCH") {
    orchestrator.resetKillSwitch();
    reply = ok();
    reply["state"] = domain::engineStateToString(orchestrator.state());
  } else if (args[0] == "STOP") {
    orchestrator.requestStop();
    reply = ok("stop requested");
  } else if (args[0] == "SET_WEIGHT") {
    if (args.size() != 3) {
      reply = error("usage: SET_WEIGHT <name> <weight>");
    } else {
      double weight = 0.0;
      try {
        std::size_t used = 0;
        weight = std::stod(args[2], &used);
        if (used != args[2].size()) {
          throw std::invalid_argument(args[2]);
        }
      } catch (const std::logic_error&) {
        return error("weight must be a number, got '" + args[2] + "'").dump();
      }
      try {
        reply = orchestrator.setStrategyWeight(args[1], weight)
                    ? ok()
                    : unknownSource(args[1]);
      } catch (const std::invalid_argument& e) {
        reply = error(e.what());
      }
    }
  } else if (args[0] == "ENABLE" || args[0] == "DISABLE") {
    if (args.size() != 2) {
      reply = error("usage: " + args[0] + " <name>");
    } else {
      const bool found = args[0] == "ENABLE"
                             ? orchestrator.enableStrategy(args[1])
                             : orchestrator.disableStrategy(args[1]);
      reply = found ? ok() : unknownSource(args[1]);
    }
  } else {
    reply = error("unknown command '" + args[0] + "'");
  }

  return reply.dump();
}

}  // namespace autotrader
