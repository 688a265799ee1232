#pragma once

#include "autotrader/gateway/i_market_data_provider.hpp"
#include "autotrader/gateway/tick_series.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace autotrader {

// A decoded feed message.
struct Tick {
  std::string symbol;
  domain::PricePoint point;
};

// -----------------------------------------------------------------------------
// ZmqMarketDataProvider: market snapshots from a ZeroMQ tick feed
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to a PUB feed of JSON ticks, keeps a rolling series per
//         symbol and assembles a MarketSnapshot on demand.
//
// @details
// Expected tick format:
//   {"symbol": "BTC/USDT", "price": 50123.5, "volume": 0.8,
//    "timestamp_ms": 1700000000000}
//
// fetchSnapshot(symbol):
//   1. Drains every message already queued on the socket (non-blocking).
//   2. If the symbol still has no tick, waits for messages until the
//      receive timeout elapses.
//   3. Throws MarketDataError if no tick exists, or if the newest tick is
//      older than max_tick_age_ms according to the injected clock.
//
// Malformed messages are logged as warnings and skipped.
//
// Thread model:
//   Polled from the orchestrator thread only. There is no background
//   receive thread; ZMQ buffers ticks between cycles (subject to the
//   socket's high-water mark, beyond which the oldest are dropped).
//
// Ownership:
//   Owns the ZMQ context and SUB socket (RAII). Holds a reference to the
//   time provider, which must outlive it.
// -----------------------------------------------------------------------------
class ZmqMarketDataProvider final : public IMarketDataProvider {
 public:
  ZmqMarketDataProvider(const ITimeProvider& clock, const std::string& endpoint,
                        std::size_t series_capacity,
                        std::int64_t max_tick_age_ms, int receive_timeout_ms);

  ZmqMarketDataProvider(const ZmqMarketDataProvider&) = delete;
  ZmqMarketDataProvider& operator=(const ZmqMarketDataProvider&) = delete;
  ZmqMarketDataProvider(ZmqMarketDataProvider&&) = delete;
  ZmqMarketDataProvider& operator=(ZmqMarketDataProvider&&) = delete;

  domain::MarketSnapshot fetchSnapshot(const std::string& symbol) override;

  // @throws MarketDataError for invalid JSON, missing fields or a
  //         non-positive price.
  static Tick decodeTick(const std::string& payload);

 private:
  // Receives at most one message with the given flags and stores it.
  // Returns false when nothing was received.
  bool receiveOne(zmq::recv_flags flags);

  const ITimeProvider& clock_;
  const std::int64_t max_tick_age_ms_;
  const int receive_timeout_ms_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  TickSeries series_;
};

}  // namespace autotrader
