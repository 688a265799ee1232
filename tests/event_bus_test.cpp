// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for autotrader::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only its event type
//   - Unsubscribe stops delivery
//   - Re-entrant publish from inside a callback does not deadlock
//   - Payloads survive the variant dispatch intact
// =============================================================================

#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

// =============================================================================
// Test fixture: a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  autotrader::EventBus bus;

  static autotrader::RiskRejectEvent makeReject(const std::string& reason) {
    return autotrader::RiskRejectEvent{"BTC/USDT", reason, 1000};
  }

  static autotrader::EngineStatusEvent makeStatus(double balance) {
    autotrader::EngineStatusEvent e;
    e.state = autotrader::domain::EngineState::Running;
    e.balance = balance;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// Why: The control server bridges telemetry with one generic subscription.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const autotrader::Event&) { ++calls; });

  bus.publish(makeReject("daily loss limit reached"));
  bus.publish(makeStatus(10000.0));
  bus.publish(autotrader::KillSwitchEvent{});

  EXPECT_EQ(calls, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  std::vector<std::string> reasons;
  bus.subscribe<autotrader::RiskRejectEvent>(
      [&reasons](const autotrader::RiskRejectEvent& e) {
        reasons.push_back(e.reason);
      });

  bus.publish(makeStatus(1.0));
  bus.publish(makeReject("trading locked by kill switch"));
  bus.publish(autotrader::KillSwitchEvent{});

  ASSERT_EQ(reasons.size(), 1u);
  EXPECT_EQ(reasons[0], "trading locked by kill switch");
}

// -----------------------------------------------------------------------------
// 3. Every subscriber receives the same event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe<autotrader::EngineStatusEvent>(
      [&a](const autotrader::EngineStatusEvent&) { ++a; });
  bus.subscribe<autotrader::EngineStatusEvent>(
      [&b](const autotrader::EngineStatusEvent&) { ++b; });

  bus.publish(makeStatus(5.0));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribe stops delivery; unknown ids are ignored.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe([&calls](const autotrader::Event&) { ++calls; });

  bus.publish(makeStatus(1.0));
  bus.unsubscribe(id);
  bus.unsubscribe(9999);
  bus.publish(makeStatus(2.0));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, PublishWithoutSubscribersIsNoOp) {
  EXPECT_NO_THROW(bus.publish(makeStatus(1.0)));
}

// -----------------------------------------------------------------------------
// 5. A callback that publishes must not deadlock.
// Why: publish() runs callbacks outside the lock.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantPublishDoesNotDeadlock) {
  int statuses = 0;
  bus.subscribe<autotrader::RiskRejectEvent>(
      [this](const autotrader::RiskRejectEvent&) {
        bus.publish(makeStatus(42.0));
      });
  bus.subscribe<autotrader::EngineStatusEvent>(
      [&statuses](const autotrader::EngineStatusEvent& e) {
        EXPECT_DOUBLE_EQ(e.balance, 42.0);
        ++statuses;
      });

  bus.publish(makeReject("x"));

  EXPECT_EQ(statuses, 1);
}

// -----------------------------------------------------------------------------
// 6. A throwing subscriber propagates out of publish().
// Why: The orchestrator wraps publish() itself; the bus must not hide errors.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberExceptionPropagates) {
  bus.subscribe([](const autotrader::Event&) {
    throw std::runtime_error("sink down");
  });

  EXPECT_THROW(bus.publish(makeStatus(1.0)), std::runtime_error);
}

// -----------------------------------------------------------------------------
// 7. Trade payload survives the variant.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TradeExecutedPayloadIntact) {
  autotrader::domain::Trade received;
  bus.subscribe<autotrader::TradeExecutedEvent>(
      [&received](const autotrader::TradeExecutedEvent& e) {
        received = e.trade;
      });

  autotrader::domain::Trade t;
  t.symbol = "BTC/USDT";
  t.side = autotrader::domain::Side::Sell;
  t.amount = 0.01;
  t.entry_price = 50000.0;
  t.exit_price = 52000.0;
  t.realized_pnl = 20.0;
  t.rationale = "signal";
  bus.publish(autotrader::TradeExecutedEvent{t});

  EXPECT_EQ(received.symbol, "BTC/USDT");
  EXPECT_EQ(received.side, autotrader::domain::Side::Sell);
  ASSERT_TRUE(received.realized_pnl.has_value());
  EXPECT_DOUBLE_EQ(*received.realized_pnl, 20.0);
}
