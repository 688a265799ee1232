#include "autotrader/execution/live_execution_adapter.hpp"
#include "autotrader/errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace autotrader {

LiveExecutionAdapter::LiveExecutionAdapter(IExchange& exchange,
                                           const std::string& venue)
    : exchange_(exchange), venue_(makeVenueProfile(venue)) {
  std::cout << "[LiveExecution] venue=" << venue_->name() << "\n";
}

domain::OrderResult LiveExecutionAdapter::buy(const std::string& symbol,
                                              double amount) {
  return marketOrder(symbol, domain::Side::Buy, amount);
}

domain::OrderResult LiveExecutionAdapter::sell(const std::string& symbol,
                                               double amount) {
  return marketOrder(symbol, domain::Side::Sell, amount);
}

// -----------------------------------------------------------------------------
// placeStopLoss(): venue profile decides type and params
// -----------------------------------------------------------------------------
domain::OrderResult LiveExecutionAdapter::placeStopLoss(
    const std::string& symbol, double amount, double stop_price) {
  const StopOrderRequest request = venue_->stopLoss(stop_price);

  ExchangeOrder order;
  try {
    order = exchange_.createStopOrder(symbol, domain::Side::Sell, amount,
                                      request.type, request.params);
  } catch (const std::exception& e) {
    throw ExecutionError("stop-loss for " + symbol + " failed: " + e.what());
  }

  domain::OrderResult r;
  r.id = order.id;
  r.symbol = symbol;
  r.side = domain::Side::Sell;
  r.type = domain::OrderType::StopLoss;
  r.amount = amount;
  r.fill_price = stop_price;
  r.status = mapStatus(order.status);
  r.simulated = false;

  std::cout << "[LiveExecution] stop-loss " << r.id << " " << symbol
            << " amount=" << amount << " stop=" << stop_price
            << " type=" << request.type << "\n";
  return r;
}

void LiveExecutionAdapter::cancelOrder(const std::string& order_id,
                                       const std::string& symbol) {
  try {
    exchange_.cancelOrder(order_id, symbol);
  } catch (const std::exception& e) {
    throw ExecutionError("cancel " + order_id + " for " + symbol +
                         " failed: " + e.what());
  }
  std::cout << "[LiveExecution] canceled " << order_id << " " << symbol
            << "\n";
}

double LiveExecutionAdapter::currentPrice(const std::string& symbol) {
  Ticker ticker;
  try {
    ticker = exchange_.fetchTicker(symbol);
  } catch (const std::exception& e) {
    throw ExecutionError("ticker for " + symbol + " failed: " + e.what());
  }
  if (!(ticker.last > 0.0)) {
    throw ExecutionError("ticker for " + symbol + " has no last price");
  }
  return ticker.last;
}

domain::OrderStatus LiveExecutionAdapter::mapStatus(
    const std::string& venue_status) {
  std::string s = venue_status;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (s == "closed" || s == "filled") {
    return domain::OrderStatus::Filled;
  }
  if (s == "canceled" || s == "cancelled" || s == "expired") {
    return domain::OrderStatus::Canceled;
  }
  if (s == "rejected") {
    return domain::OrderStatus::Rejected;
  }
  return domain::OrderStatus::Open;
}

domain::OrderResult LiveExecutionAdapter::marketOrder(const std::string& symbol,
                                                      domain::Side side,
                                                      double amount) {
  ExchangeOrder order;
  try {
    order = exchange_.createMarketOrder(symbol, side, amount);
  } catch (const std::exception& e) {
    throw ExecutionError(std::string(domain::sideToString(side)) + " " +
                         symbol + " failed: " + e.what());
  }

  domain::OrderResult r;
  r.id = order.id;
  r.symbol = symbol;
  r.side = side;
  r.type = domain::OrderType::Market;
  r.amount = order.filled > 0.0 ? order.filled : amount;
  r.fill_price = order.average_price;
  r.status = mapStatus(order.status);
  r.simulated = false;

  if (r.status == domain::OrderStatus::Rejected ||
      r.status == domain::OrderStatus::Canceled) {
    throw ExecutionError(std::string(domain::sideToString(side)) + " " +
                         symbol + " order " + r.id + " was " +
                         domain::orderStatusToString(r.status));
  }
  if (r.status == domain::OrderStatus::Open && !(order.filled > 0.0)) {
    // Unfilled market orders are pulled so they cannot fill later unbooked.
    std::string what = std::string(domain::sideToString(side)) + " " + symbol +
                       " order " + r.id + " was not filled";
    try {
      exchange_.cancelOrder(r.id, symbol);
    } catch (const std::exception& e) {
      what += "; cancel failed: " + std::string(e.what());
    }
    throw ExecutionError(what);
  }

  std::cout << "[LiveExecution] " << domain::sideToString(side) << " " << r.id
            << " " << symbol << " amount=" << r.amount
            << " price=" << r.fill_price << "\n";
  return r;
}

}  // namespace autotrader
