#include "autotrader/execution/paper_execution_adapter.hpp"

#include <iostream>
#include <stdexcept>

namespace autotrader {

PaperExecutionAdapter::PaperExecutionAdapter(double reference_price)
    : reference_price_(reference_price) {
  if (!(reference_price > 0.0)) {
    throw std::invalid_argument("paper reference price must be positive");
  }
}

domain::OrderResult PaperExecutionAdapter::buy(const std::string& symbol,
                                               double amount) {
  return fill(symbol, domain::Side::Buy, amount);
}

domain::OrderResult PaperExecutionAdapter::sell(const std::string& symbol,
                                                double amount) {
  return fill(symbol, domain::Side::Sell, amount);
}

domain::OrderResult PaperExecutionAdapter::placeStopLoss(
    const std::string& symbol, double amount, double stop_price) {
  domain::OrderResult r;
  r.id = nextId();
  r.symbol = symbol;
  r.side = domain::Side::Sell;
  r.type = domain::OrderType::StopLoss;
  r.amount = amount;
  r.fill_price = stop_price;
  r.status = domain::OrderStatus::Open;
  r.simulated = true;

  std::cout << "[PaperExecution] stop-loss " << r.id << " " << symbol
            << " amount=" << amount << " stop=" << stop_price << "\n";
  return r;
}

void PaperExecutionAdapter::cancelOrder(const std::string& order_id,
                                        const std::string& symbol) {
  std::cout << "[PaperExecution] canceled " << order_id << " " << symbol
            << "\n";
}

double PaperExecutionAdapter::currentPrice(const std::string& symbol) {
  return priceFor(symbol);
}

void PaperExecutionAdapter::onMarketPrice(const std::string& symbol,
                                          double price) {
  if (!(price > 0.0)) {
    return;
  }
  std::lock_guard lock(marks_mutex_);
  marks_[symbol] = price;
}

void PaperExecutionAdapter::setReferencePrice(double price) {
  if (!(price > 0.0)) {
    throw std::invalid_argument("paper reference price must be positive");
  }
  reference_price_.store(price);
}

domain::OrderResult PaperExecutionAdapter::fill(const std::string& symbol,
                                                domain::Side side,
                                                double amount) {
  domain::OrderResult r;
  r.id = nextId();
  r.symbol = symbol;
  r.side = side;
  r.type = domain::OrderType::Market;
  r.amount = amount;
  r.fill_price = priceFor(symbol);
  r.status = domain::OrderStatus::Filled;
  r.simulated = true;

  std::cout << "[PaperExecution] " << domain::sideToString(side) << " "
            << r.id << " " << symbol << " amount=" << amount
            << " price=" << r.fill_price << "\n";
  return r;
}

double PaperExecutionAdapter::priceFor(const std::string& symbol) const {
  std::lock_guard lock(marks_mutex_);
  auto it = marks_.find(symbol);
  return it != marks_.end() ? it->second : reference_price_.load();
}

std::string PaperExecutionAdapter::nextId() {
  return "sim-" + std::to_string(ids_.next_id());
}

}  // namespace autotrader
