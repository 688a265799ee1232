#include "autotrader/persistence/json_codec.hpp"

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"id", p.id},
                     {"symbol", p.symbol},
                     {"entry_price", p.entry_price},
                     {"amount", p.amount},
                     {"stop_loss_price", p.stop_loss_price},
                     {"current_price", p.current_price},
                     {"unrealized_pnl", p.unrealized_pnl},
                     {"status", p.status},
                     {"entry_time_ms", p.entry_time_ms},
                     {"stop_order_id", p.stop_order_id}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("id").get_to(p.id);
  j.at("symbol").get_to(p.symbol);
  j.at("entry_price").get_to(p.entry_price);
  j.at("amount").get_to(p.amount);
  j.at("stop_loss_price").get_to(p.stop_loss_price);
  p.current_price = j.value("current_price", p.entry_price);
  p.unrealized_pnl = j.value("unrealized_pnl", 0.0);
  j.at("status").get_to(p.status);
  p.entry_time_ms = j.value("entry_time_ms", std::int64_t{0});
  p.stop_order_id = j.value("stop_order_id", std::string{});
}

// -----------------------------------------------------------------------------
// SignalSnapshot / Trade
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const SignalSnapshot& s) {
  j = nlohmann::json{{"source", s.source_name},
                     {"direction", s.direction},
                     {"confidence", s.confidence},
                     {"weight", s.weight}};
}

void from_json(const nlohmann::json& j, SignalSnapshot& s) {
  j.at("source").get_to(s.source_name);
  j.at("direction").get_to(s.direction);
  j.at("confidence").get_to(s.confidence);
  j.at("weight").get_to(s.weight);
}

void to_json(nlohmann::json& j, const Trade& t) {
  j = nlohmann::json{{"symbol", t.symbol},
                     {"side", t.side},
                     {"amount", t.amount},
                     {"entry_price", t.entry_price},
                     {"exit_price", nullptr},
                     {"realized_pnl", nullptr},
                     {"signals", t.signal_snapshot},
                     {"rationale", t.rationale},
                     {"timestamp_ms", t.timestamp_ms},
                     {"position_id", t.position_id},
                     {"order_id", t.order_id},
                     {"simulated", t.simulated}};
  if (t.exit_price) {
    j["exit_price"] = *t.exit_price;
  }
  if (t.realized_pnl) {
    j["realized_pnl"] = *t.realized_pnl;
  }
}

void from_json(const nlohmann::json& j, Trade& t) {
  j.at("symbol").get_to(t.symbol);
  j.at("side").get_to(t.side);
  j.at("amount").get_to(t.amount);
  j.at("entry_price").get_to(t.entry_price);
  t.exit_price.reset();
  t.realized_pnl.reset();
  if (j.contains("exit_price") && !j.at("exit_price").is_null()) {
    t.exit_price = j.at("exit_price").get<double>();
  }
  if (j.contains("realized_pnl") && !j.at("realized_pnl").is_null()) {
    t.realized_pnl = j.at("realized_pnl").get<double>();
  }
  t.signal_snapshot =
      j.value("signals", std::vector<SignalSnapshot>{});
  t.rationale = j.value("rationale", std::string{});
  j.at("timestamp_ms").get_to(t.timestamp_ms);
  t.position_id = j.value("position_id", PositionId{0});
  t.order_id = j.value("order_id", std::string{});
  t.simulated = j.value("simulated", false);
}

// -----------------------------------------------------------------------------
// RiskState
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RiskState& r) {
  j = nlohmann::json{{"starting_capital", r.starting_capital},
                     {"daily_loss_percent", r.daily_loss_percent},
                     {"total_loss_percent", r.total_loss_percent},
                     {"locked", r.locked},
                     {"daily_anchor_day", r.daily_anchor_day}};
}

void from_json(const nlohmann::json& j, RiskState& r) {
  j.at("starting_capital").get_to(r.starting_capital);
  j.at("daily_loss_percent").get_to(r.daily_loss_percent);
  j.at("total_loss_percent").get_to(r.total_loss_percent);
  j.at("locked").get_to(r.locked);
  j.at("daily_anchor_day").get_to(r.daily_anchor_day);
}

}  // namespace domain

// -----------------------------------------------------------------------------
// EngineStateRecord
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const EngineStateRecord& s) {
  j = nlohmann::json{{"risk", s.risk},
                     {"balance", s.balance},
                     {"daily_realized_pnl", s.daily_realized_pnl},
                     {"total_realized_pnl", s.total_realized_pnl}};
}

void from_json(const nlohmann::json& j, EngineStateRecord& s) {
  j.at("risk").get_to(s.risk);
  j.at("balance").get_to(s.balance);
  j.at("daily_realized_pnl").get_to(s.daily_realized_pnl);
  j.at("total_realized_pnl").get_to(s.total_realized_pnl);
}

}  // namespace autotrader
