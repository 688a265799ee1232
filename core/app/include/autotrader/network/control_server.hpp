#pragma once

#include "autotrader/concurrent/thread_safe_queue.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace autotrader {

// -----------------------------------------------------------------------------
// ControlServer: ZeroMQ operator surface: commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread with a REP command socket and a PUB
//         telemetry socket.
//
// @details
// Telemetry (PUB, default tcp://127.0.0.1:5557):
//   The constructor subscribes to every Event on the EventBus. The
//   subscriber only pushes a copy into a ThreadSafeQueue, so the
//   orchestrator thread never waits on JSON formatting or socket I/O. The
//   server thread drains the queue and publishes one JSON document per
//   event, e.g. {"type": "trade_executed", ...}. Sends use dontwait; with
//   no subscriber connected the message is dropped.
//
// Commands (REP, default tcp://127.0.0.1:5556):
//   Each request string goes to the command handler (bound to
//   executeCommand() for the orchestrator) and its JSON reply is sent back.
//   ZMQ_RCVTIMEO keeps the loop alternating between commands and
//   telemetry.
//
// Thread model:
//   start()/stop() on the owning thread. The handler runs on the server
//   thread and must only use thread-safe orchestrator accessors.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the queue and the thread. Holds a
//   reference to the EventBus, which must outlive it; the destructor
//   unsubscribes.
// -----------------------------------------------------------------------------
class ControlServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  ControlServer(EventBus& bus, CommandHandler command_handler,
                std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;
  ControlServer(ControlServer&&) = delete;
  ControlServer& operator=(ControlServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op if already running.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  JSON document for one event. Every alternative of Event has a
  //         "type" key: position_update, trade_executed, risk_reject,
  //         kill_switch, engine_status.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  EventBus& bus_;
  EventBus::SubscriptionId subscription_;

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace autotrader
