#pragma once

#include "autotrader/concurrent/id_generator.hpp"
#include "autotrader/execution/i_execution_adapter.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

namespace autotrader {

// -----------------------------------------------------------------------------
// PaperExecutionAdapter: simulated fills for paper trading
// -----------------------------------------------------------------------------
//
// @brief  Every order succeeds immediately with a synthetic id "sim-<n>"
//         and simulated = true.
//
// @details
// Pricing: a symbol fills at the last price passed to onMarketPrice() for
// it (the orchestrator marks its traded symbol every cycle). A symbol never
// marked fills at the configured reference price, which stays constant
// unless setReferencePrice() moves it; currentPrice() follows the same
// rule. So a restored position in a symbol the feed does not carry is
// closed at the reference price, not at a market price.
//
// Deterministic: ids count up from sim-1. Market orders report Filled;
// stop orders report Open (they rest until triggered, which the ledger
// monitors). cancelOrder() only logs.
// -----------------------------------------------------------------------------
class PaperExecutionAdapter final : public IExecutionAdapter {
 public:
  explicit PaperExecutionAdapter(double reference_price);

  domain::OrderResult buy(const std::string& symbol, double amount) override;
  domain::OrderResult sell(const std::string& symbol, double amount) override;
  domain::OrderResult placeStopLoss(const std::string& symbol, double amount,
                                    double stop_price) override;
  void cancelOrder(const std::string& order_id,
                   const std::string& symbol) override;
  double currentPrice(const std::string& symbol) override;
  void onMarketPrice(const std::string& symbol, double price) override;

  void setReferencePrice(double price);

 private:
  domain::OrderResult fill(const std::string& symbol, domain::Side side,
                           double amount);
  std::string nextId();
  double priceFor(const std::string& symbol) const;

  std::atomic<double> reference_price_;
  mutable std::mutex marks_mutex_;
  std::unordered_map<std::string, double> marks_;
  IdGenerator ids_;
};

}  // namespace autotrader
