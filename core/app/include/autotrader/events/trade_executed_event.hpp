#pragma once

#include "autotrader/domain/trade.hpp"

namespace autotrader {

// -----------------------------------------------------------------------------
// TradeExecutedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once for every executed market order, carrying the same
//         Trade record that was handed to the persistence collaborator.
// -----------------------------------------------------------------------------
struct TradeExecutedEvent {
  domain::Trade trade;
};

}  // namespace autotrader
