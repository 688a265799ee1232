#include "autotrader/domain/order.hpp"

namespace autotrader {
namespace domain {

const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* orderTypeToString(OrderType t) {
  switch (t) {
    case OrderType::Market:   return "market";
    case OrderType::StopLoss: return "stop_loss";
  }
  return "unknown";
}

const char* orderStatusToString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Open:     return "open";
    case OrderStatus::Filled:   return "filled";
    case OrderStatus::Canceled: return "canceled";
    case OrderStatus::Rejected: return "rejected";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace autotrader
