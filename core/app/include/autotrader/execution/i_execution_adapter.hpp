#pragma once

#include "autotrader/domain/order.hpp"

#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// IExecutionAdapter: order placement seam between the orchestrator and a
// venue
// -----------------------------------------------------------------------------
//
// @brief  buy / sell / placeStopLoss / cancelOrder / currentPrice. The
//         paper and live
//         variants implement the same interface so the orchestrator never
//         knows which one it drives.
//
// @details
// Failure policy: any failure throws ExecutionError. Nothing is swallowed;
// the orchestrator decides whether to retry on the next cycle.
//
// Thread model: Called only from the orchestrator thread.
// -----------------------------------------------------------------------------
class IExecutionAdapter {
 public:
  virtual ~IExecutionAdapter() = default;

  virtual domain::OrderResult buy(const std::string& symbol,
                                  double amount) = 0;

  virtual domain::OrderResult sell(const std::string& symbol,
                                   double amount) = 0;

  // Places a resting sell-stop for a long position. The result's fill_price
  // carries the trigger price.
  virtual domain::OrderResult placeStopLoss(const std::string& symbol,
                                            double amount,
                                            double stop_price) = 0;

  // Cancels a resting order, e.g. the stop of a position being closed.
  virtual void cancelOrder(const std::string& order_id,
                           const std::string& symbol) = 0;

  virtual double currentPrice(const std::string& symbol) = 0;

  // Latest market price seen by the orchestrator for symbol, once per
  // cycle. Variants that price their own fills use it; others ignore it.
  virtual void onMarketPrice(const std::string& symbol, double price) = 0;
};

}  // namespace autotrader
