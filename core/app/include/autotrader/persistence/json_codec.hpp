#pragma once

#include "autotrader/domain/order.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/domain/risk_state.hpp"
#include "autotrader/domain/signal.hpp"
#include "autotrader/domain/trade.hpp"
#include "autotrader/persistence/i_trade_store.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON representation of the persisted and published value types
// -----------------------------------------------------------------------------
// nlohmann::json finds these through ADL, so `nlohmann::json j = position;`
// and `j.get<domain::Trade>()` work anywhere this header is included. The
// same shapes are written to the journals and sent as telemetry.
//
// Enums are written as their display strings ("BUY", "OPEN", ...).
// from_json throws nlohmann::json::exception on missing keys or wrong types.
// -----------------------------------------------------------------------------

namespace autotrader {
namespace domain {

NLOHMANN_JSON_SERIALIZE_ENUM(Direction, {
    {Direction::Buy, "BUY"},
    {Direction::Sell, "SELL"},
    {Direction::Hold, "HOLD"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Side, {
    {Side::Buy, "BUY"},
    {Side::Sell, "SELL"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PositionStatus, {
    {PositionStatus::Open, "OPEN"},
    {PositionStatus::Closed, "CLOSED"},
})

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const SignalSnapshot& s);
void from_json(const nlohmann::json& j, SignalSnapshot& s);

void to_json(nlohmann::json& j, const Trade& t);
void from_json(const nlohmann::json& j, Trade& t);

void to_json(nlohmann::json& j, const RiskState& r);
void from_json(const nlohmann::json& j, RiskState& r);

}  // namespace domain

void to_json(nlohmann::json& j, const EngineStateRecord& s);
void from_json(const nlohmann::json& j, EngineStateRecord& s);

}  // namespace autotrader
