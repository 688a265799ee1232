#pragma once

#include "autotrader/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// ExchangeOrder: an order as the venue reports it
// -----------------------------------------------------------------------------
// status is the venue's own vocabulary ("closed", "open", "canceled", ...);
// the live adapter maps it onto domain::OrderStatus.
// -----------------------------------------------------------------------------
struct ExchangeOrder {
  std::string id;
  std::string status;
  double filled{0.0};
  double average_price{0.0};
};

struct Ticker {
  std::string symbol;
  double last{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// IExchange: unified exchange capability used by LiveExecutionAdapter
// -----------------------------------------------------------------------------
//
// @brief  createMarketOrder / createStopOrder / cancelOrder / fetchTicker,
//         nothing else.
//
// @details
// Authentication, rate limiting and wire formats live behind this
// interface. createStopOrder takes the venue-specific order type and
// parameter object already resolved by a VenueProfile.
//
// Every method throws on failure; implementations must not return a
// half-filled ExchangeOrder to signal an error.
// -----------------------------------------------------------------------------
class IExchange {
 public:
  virtual ~IExchange() = default;

  virtual ExchangeOrder createMarketOrder(const std::string& symbol,
                                          domain::Side side,
                                          double amount) = 0;

  virtual ExchangeOrder createStopOrder(const std::string& symbol,
                                        domain::Side side, double amount,
                                        const std::string& type,
                                        const nlohmann::json& params) = 0;

  virtual void cancelOrder(const std::string& order_id,
                           const std::string& symbol) = 0;

  virtual Ticker fetchTicker(const std::string& symbol) = 0;
};

}  // namespace autotrader
