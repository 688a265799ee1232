#pragma once

#include "autotrader/execution/i_exchange.hpp"
#include "autotrader/execution/i_execution_adapter.hpp"
#include "autotrader/execution/venue_profile.hpp"

#include <memory>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// LiveExecutionAdapter: real orders through an IExchange
// -----------------------------------------------------------------------------
//
// @brief  Delegates to the exchange capability and converts its replies into
//         OrderResult with the venue's native order id and simulated = false.
//
// @details
// The VenueProfile is chosen in the constructor; an unknown venue fails
// there with ConfigError rather than on the first stop order.
//
// Any exception from the exchange is rethrown as ExecutionError naming the
// operation and symbol. A market order the venue left unfilled (status
// open, nothing filled) is an ExecutionError too. A partial fill succeeds
// and reports the filled amount and average price.
//
// Ownership:
//   Holds a reference to the IExchange, which must outlive the adapter.
//   Owns its VenueProfile.
// -----------------------------------------------------------------------------
class LiveExecutionAdapter final : public IExecutionAdapter {
 public:
  LiveExecutionAdapter(IExchange& exchange, const std::string& venue);

  domain::OrderResult buy(const std::string& symbol, double amount) override;
  domain::OrderResult sell(const std::string& symbol, double amount) override;
  domain::OrderResult placeStopLoss(const std::string& symbol, double amount,
                                    double stop_price) override;
  void cancelOrder(const std::string& order_id,
                   const std::string& symbol) override;
  double currentPrice(const std::string& symbol) override;

  // Fills are priced by the venue.
  void onMarketPrice(const std::string&, double) override {}

  const VenueProfile& venue() const { return *venue_; }

  // Maps venue status strings: closed/filled -> Filled, open/new/
  // partially_filled -> Open, canceled/cancelled/expired -> Canceled,
  // rejected -> Rejected. Anything else is treated as Open.
  static domain::OrderStatus mapStatus(const std::string& venue_status);

 private:
  domain::OrderResult marketOrder(const std::string& symbol, domain::Side side,
                                  double amount);

  IExchange& exchange_;
  std::unique_ptr<VenueProfile> venue_;
};

}  // namespace autotrader
