#pragma once

#include "autotrader/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for engine
// notifications. The orchestrator publishes position updates, executed
// trades, risk rejections, kill-switch trips and status heartbeats; the
// control server, loggers and tests subscribe.
//
// Why in architecture: The orchestrator does not know who is listening.
// Telemetry, dashboards and audit sinks attach here without touching the
// cycle code.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish(). A throwing callback propagates out of publish(); callers
// that must not fail (the orchestrator) wrap publish() themselves.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Thread-safety: Safe to call from any thread.
  // Output: SubscriptionId to use with unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds
  // an EventType (e.g. KillSwitchEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes the subscription. An in-flight publish() may still deliver the
  // current event to it.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Delivers the event to every registered subscriber on the calling
  // thread before returning.
  // Thread-safety: The subscriber list is copied under the lock and the
  // callbacks run without it, so a callback may publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that checks the variant with
// std::get_if and ignores other alternatives.
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace autotrader
