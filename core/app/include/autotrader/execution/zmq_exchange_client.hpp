#pragma once

#include "autotrader/execution/i_exchange.hpp"

#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// ZmqExchangeClient: IExchange over a ZeroMQ REQ socket
// -----------------------------------------------------------------------------
//
// @brief  Forwards exchange operations as JSON requests to an external
//         exchange-gateway process that owns credentials, rate limiting and
//         the venue wire protocol.
//
// @details
// Request / reply format:
//   -> {"op": "create_market_order", "symbol": s, "side": "buy", "amount": a}
//   -> {"op": "create_stop_order", "symbol": s, "side": "sell", "amount": a,
//       "type": t, "params": {...}}
//   -> {"op": "cancel_order", "id": i, "symbol": s}
//   -> {"op": "fetch_ticker", "symbol": s}
//   <- {"ok": true,  "order":  {"id", "status", "filled", "average"}}
//   <- {"ok": true,  "ticker": {"symbol", "last", "timestamp_ms"}}
//   <- {"ok": true}                        (cancel_order)
//   <- {"ok": false, "error": "..."}
//
// Timeouts:
//   ZMQ_SNDTIMEO / ZMQ_RCVTIMEO bound every round trip. A REQ socket that
//   missed its reply cannot send again, so on timeout the socket is closed
//   and re-created before ExecutionError is thrown. A late reply to the
//   abandoned request is discarded with the old socket.
//
// Thread model:
//   Calls are serialized by an internal mutex; the REQ socket is only ever
//   touched under it.
//
// Ownership:
//   Owns the ZMQ context and socket (RAII).
// -----------------------------------------------------------------------------
class ZmqExchangeClient final : public IExchange {
 public:
  ZmqExchangeClient(std::string endpoint, int timeout_ms);

  ZmqExchangeClient(const ZmqExchangeClient&) = delete;
  ZmqExchangeClient& operator=(const ZmqExchangeClient&) = delete;
  ZmqExchangeClient(ZmqExchangeClient&&) = delete;
  ZmqExchangeClient& operator=(ZmqExchangeClient&&) = delete;

  ExchangeOrder createMarketOrder(const std::string& symbol, domain::Side side,
                                  double amount) override;

  ExchangeOrder createStopOrder(const std::string& symbol, domain::Side side,
                                double amount, const std::string& type,
                                const nlohmann::json& params) override;

  void cancelOrder(const std::string& order_id,
                   const std::string& symbol) override;

  Ticker fetchTicker(const std::string& symbol) override;

 private:
  // Sends one request and returns the parsed reply. Throws ExecutionError on
  // timeout, transport error, malformed reply or {"ok": false}.
  nlohmann::json roundTrip(const nlohmann::json& request);

  void connect();

  static ExchangeOrder parseOrder(const nlohmann::json& reply);

  const std::string endpoint_;
  const int timeout_ms_;

  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace autotrader
