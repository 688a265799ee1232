#include "autotrader/network/control_server.hpp"
#include "autotrader/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <type_traits>
#include <utility>

namespace autotrader {

// -----------------------------------------------------------------------------
// Constructor: bridge the EventBus into the telemetry queue
// -----------------------------------------------------------------------------
ControlServer::ControlServer(EventBus& bus, CommandHandler command_handler,
                             std::string cmd_endpoint,
                             std::string pub_endpoint)
    : bus_(bus),
      command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {
  subscription_ = bus_.subscribe(
      [this](const Event& event) { telemetry_queue_.push(event); });
}

ControlServer::~ControlServer() {
  bus_.unsubscribe(subscription_);
  stop();
}

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void ControlServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ControlServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void ControlServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[ControlServer] stopped.\n";
}

void ControlServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void ControlServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string json = formatTelemetry(*event);
    zmq::message_t msg(json.data(), json.size());
    // Nothing to do when dropped: telemetry is best-effort.
    (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request, one reply
// -----------------------------------------------------------------------------
void ControlServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    response = nlohmann::json{{"status", "error"}, {"message", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one "type" per Event alternative
// -----------------------------------------------------------------------------
std::string ControlServer::formatTelemetry(const Event& event) {
  nlohmann::json j = std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          return {{"type", "position_update"},
                  {"position", e.position},
                  {"timestamp_ms", e.timestamp_ms}};
        } else if constexpr (std::is_same_v<T, TradeExecutedEvent>) {
          return {{"type", "trade_executed"}, {"trade", e.trade}};
        } else if constexpr (std::is_same_v<T, RiskRejectEvent>) {
          return {{"type", "risk_reject"},
                  {"symbol", e.symbol},
                  {"reason", e.reason},
                  {"timestamp_ms", e.timestamp_ms}};
        } else if constexpr (std::is_same_v<T, KillSwitchEvent>) {
          return {{"type", "kill_switch"},
                  {"total_loss_percent", e.total_loss_percent},
                  {"threshold_percent", e.threshold_percent},
                  {"risk_state", e.risk_state},
                  {"positions_closed", e.positions_closed},
                  {"positions_failed", e.positions_failed},
                  {"reason", e.reason},
                  {"timestamp_ms", e.timestamp_ms}};
        } else {
          static_assert(std::is_same_v<T, EngineStatusEvent>);
          return {{"type", "engine_status"},
                  {"state", domain::engineStateToString(e.state)},
                  {"paused", e.paused},
                  {"balance", e.balance},
                  {"cycle_count", e.cycle_count},
                  {"timestamp_ms", e.timestamp_ms}};
        }
      },
      event);
  return j.dump();
}

}  // namespace autotrader
