#pragma once

#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the trading side of an order or trade record.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Market orders open and close positions; StopLoss orders are resting
// protective orders placed right after an entry.
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,
  StopLoss,
};

// -----------------------------------------------------------------------------
// OrderStatus: outcome reported by the execution layer
// -----------------------------------------------------------------------------
//
// @details
// Market orders normally come back Filled. Stop orders rest on the book and
// come back Open. Canceled and Rejected are terminal failures; the
// orchestrator treats a Rejected market order as an execution failure.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Open,
  Filled,
  Canceled,
  Rejected,
};

// -----------------------------------------------------------------------------
// OrderResult
// -----------------------------------------------------------------------------
//
// @brief  Venue-neutral confirmation returned by every Execution Adapter
//         call.
//
// @details
// id is the venue's native order id for live orders and a synthetic
// "sim-<n>" id for paper orders. fill_price is 0 for orders that have not
// filled (e.g. a resting stop). simulated tells audit readers which
// variant produced the result.
//
// Thread model:
//   Value type; safe to copy between threads.
// -----------------------------------------------------------------------------
struct OrderResult {
  std::string id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  double amount{0.0};
  double fill_price{0.0};
  OrderStatus status{OrderStatus::Open};
  bool simulated{false};
};

const char* sideToString(Side s);
const char* orderTypeToString(OrderType t);
const char* orderStatusToString(OrderStatus s);

}  // namespace domain
}  // namespace autotrader
