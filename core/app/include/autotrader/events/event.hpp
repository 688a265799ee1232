#pragma once

#include "autotrader/events/event_types.hpp"
#include "autotrader/events/kill_switch_event.hpp"
#include "autotrader/events/position_update_event.hpp"
#include "autotrader/events/trade_executed_event.hpp"

#include <variant>

namespace autotrader {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for every notification the engine
// publishes (position updates, executed trades, risk rejections, kill-switch
// trips, status heartbeats).
//
// Why std::variant: value semantics with no heap allocation, and adding an
// event kind makes the compiler point at every visit site that must handle
// it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    PositionUpdateEvent,
    TradeExecutedEvent,
    RiskRejectEvent,
    KillSwitchEvent,
    EngineStatusEvent>;

}  // namespace autotrader
