#include "autotrader/execution/zmq_exchange_client.hpp"
#include "autotrader/errors.hpp"

#include <iostream>
#include <utility>

namespace autotrader {

namespace {

const char* wireSide(domain::Side side) {
  return side == domain::Side::Buy ? "buy" : "sell";
}

}  // namespace

ZmqExchangeClient::ZmqExchangeClient(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  connect();
}

// -----------------------------------------------------------------------------
// connect(): (re)create the REQ socket
// -----------------------------------------------------------------------------
void ZmqExchangeClient::connect() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_->set(zmq::sockopt::sndtimeo, timeout_ms_);
  // Pending requests are dropped on close instead of blocking shutdown.
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

ExchangeOrder ZmqExchangeClient::createMarketOrder(const std::string& symbol,
                                                   domain::Side side,
                                                   double amount) {
  nlohmann::json request = {{"op", "create_market_order"},
                            {"symbol", symbol},
                            {"side", wireSide(side)},
                            {"amount", amount}};
  return parseOrder(roundTrip(request));
}

ExchangeOrder ZmqExchangeClient::createStopOrder(const std::string& symbol,
                                                 domain::Side side,
                                                 double amount,
                                                 const std::string& type,
                                                 const nlohmann::json& params) {
  nlohmann::json request = {{"op", "create_stop_order"},
                            {"symbol", symbol},
                            {"side", wireSide(side)},
                            {"amount", amount},
                            {"type", type},
                            {"params", params}};
  return parseOrder(roundTrip(request));
}

void ZmqExchangeClient::cancelOrder(const std::string& order_id,
                                    const std::string& symbol) {
  roundTrip({{"op", "cancel_order"}, {"id", order_id}, {"symbol", symbol}});
}

Ticker ZmqExchangeClient::fetchTicker(const std::string& symbol) {
  nlohmann::json reply =
      roundTrip({{"op", "fetch_ticker"}, {"symbol", symbol}});
  try {
    const auto& t = reply.at("ticker");
    Ticker ticker;
    ticker.symbol = t.value("symbol", symbol);
    ticker.last = t.at("last").get<double>();
    ticker.timestamp_ms = t.value("timestamp_ms", std::int64_t{0});
    return ticker;
  } catch (const nlohmann::json::exception& e) {
    throw ExecutionError(std::string("malformed ticker reply: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// roundTrip(): send, wait for reply, reset the socket on timeout
// -----------------------------------------------------------------------------
nlohmann::json ZmqExchangeClient::roundTrip(const nlohmann::json& request) {
  std::lock_guard lock(mutex_);

  const std::string payload = request.dump();
  const std::string op = request.value("op", "");

  zmq::message_t reply_msg;
  try {
    auto sent = socket_->send(zmq::buffer(payload), zmq::send_flags::none);
    if (!sent.has_value()) {
      connect();
      throw ExecutionError("exchange bridge send timed out (" + op + ")");
    }
    auto received = socket_->recv(reply_msg, zmq::recv_flags::none);
    if (!received.has_value()) {
      std::cerr << "[ZmqExchangeClient] WARNING: no reply to " << op
                << " within " << timeout_ms_ << " ms, reconnecting\n";
      connect();
      throw ExecutionError("exchange bridge timed out (" + op + ")");
    }
  } catch (const zmq::error_t& e) {
    connect();
    throw ExecutionError("exchange bridge transport error (" + op +
                         "): " + e.what());
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(reply_msg.to_string());
  } catch (const nlohmann::json::parse_error& e) {
    throw ExecutionError("exchange bridge sent invalid JSON (" + op +
                         "): " + e.what());
  }

  if (!reply.is_object() || !reply.value("ok", false)) {
    std::string error = reply.is_object()
                            ? reply.value("error", std::string("unknown error"))
                            : std::string("reply is not an object");
    throw ExecutionError("exchange rejected " + op + ": " + error);
  }
  return reply;
}

ExchangeOrder ZmqExchangeClient::parseOrder(const nlohmann::json& reply) {
  try {
    const auto& o = reply.at("order");
    ExchangeOrder order;
    order.id = o.at("id").get<std::string>();
    order.status = o.value("status", std::string("open"));
    order.filled = o.value("filled", 0.0);
    order.average_price = o.value("average", 0.0);
    return order;
  } catch (const nlohmann::json::exception& e) {
    throw ExecutionError(std::string("malformed order reply: ") + e.what());
  }
}

}  // namespace autotrader
