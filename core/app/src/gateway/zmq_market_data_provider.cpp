#include "autotrader/gateway/zmq_market_data_provider.hpp"
#include "autotrader/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>

namespace autotrader {

// -----------------------------------------------------------------------------
// Constructor: connect SUB socket, subscribe to everything
// -----------------------------------------------------------------------------
ZmqMarketDataProvider::ZmqMarketDataProvider(const ITimeProvider& clock,
                                             const std::string& endpoint,
                                             std::size_t series_capacity,
                                             std::int64_t max_tick_age_ms,
                                             int receive_timeout_ms)
    : clock_(clock),
      max_tick_age_ms_(max_tick_age_ms),
      receive_timeout_ms_(receive_timeout_ms),
      series_(series_capacity) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, receive_timeout_ms_);
  socket_.connect(endpoint);

  std::cout << "[MarketData] connected to " << endpoint << "\n";
}

// -----------------------------------------------------------------------------
// fetchSnapshot(): drain, wait if empty, check staleness
// -----------------------------------------------------------------------------
domain::MarketSnapshot ZmqMarketDataProvider::fetchSnapshot(
    const std::string& symbol) {
  while (receiveOne(zmq::recv_flags::dontwait)) {
  }

  if (!series_.latest(symbol).has_value()) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(receive_timeout_ms_);
    while (!series_.latest(symbol).has_value() &&
           std::chrono::steady_clock::now() < deadline) {
      // Blocks for at most ZMQ_RCVTIMEO.
      receiveOne(zmq::recv_flags::none);
    }
  }

  auto latest = series_.latest(symbol);
  if (!latest.has_value()) {
    throw MarketDataError("no market data received for " + symbol);
  }

  const std::int64_t age_ms = clock_.now_ms() - latest->timestamp_ms;
  if (age_ms > max_tick_age_ms_) {
    throw MarketDataError("market data for " + symbol + " is stale (" +
                          std::to_string(age_ms / 1000) + " s old)");
  }

  domain::MarketSnapshot snapshot;
  snapshot.symbol = symbol;
  snapshot.price = latest->price;
  snapshot.timestamp_ms = latest->timestamp_ms;
  snapshot.recent_series = series_.series(symbol);
  return snapshot;
}

bool ZmqMarketDataProvider::receiveOne(zmq::recv_flags flags) {
  zmq::message_t msg;
  auto result = socket_.recv(msg, flags);
  if (!result.has_value()) {
    return false;
  }

  std::string payload = msg.to_string();
  try {
    Tick tick = decodeTick(payload);
    if (!series_.append(tick.symbol, tick.point)) {
      std::cerr << "[MarketData] WARNING: out-of-order tick dropped for "
                << tick.symbol << "\n";
    }
  } catch (const MarketDataError& e) {
    std::cerr << "[MarketData] WARNING: " << e.what()
              << " payload: " << payload << "\n";
  }
  return true;
}

// -----------------------------------------------------------------------------
// decodeTick(): JSON -> Tick
// -----------------------------------------------------------------------------
Tick ZmqMarketDataProvider::decodeTick(const std::string& payload) {
  Tick tick;
  try {
    auto json = nlohmann::json::parse(payload);
    tick.symbol = json.at("symbol").get<std::string>();
    tick.point.price = json.at("price").get<double>();
    tick.point.volume = json.value("volume", 0.0);
    tick.point.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
  } catch (const nlohmann::json::exception& e) {
    throw MarketDataError(std::string("malformed tick: ") + e.what());
  }
  if (!(tick.point.price > 0.0)) {
    throw MarketDataError("tick price must be positive for " + tick.symbol);
  }
  return tick;
}

}  // namespace autotrader
