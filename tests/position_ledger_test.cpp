// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for autotrader::PositionLedger.
//
// Validates:
//   - open() assigns ids and rejects a second open position per symbol
//   - revalue() marks to market; closed positions keep frozen P&L
//   - close() is one-shot
//   - Stop-loss breach detection (price <= stop)
//   - hydrate() restores positions and keeps ids unique
// =============================================================================

#include "autotrader/risk/position_ledger.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using autotrader::PositionLedger;
using autotrader::domain::PositionStatus;

class PositionLedgerTest : public ::testing::Test {
 protected:
  PositionLedger ledger;
};

TEST_F(PositionLedgerTest, OpenRecordsPosition) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0, 1234);

  EXPECT_EQ(pos.id, 1u);
  EXPECT_EQ(pos.status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(pos.current_price, 50000.0);
  EXPECT_DOUBLE_EQ(pos.unrealized_pnl, 0.0);
  EXPECT_EQ(pos.entry_time_ms, 1234);
  EXPECT_TRUE(ledger.hasOpenPosition("BTC/USDT"));
  EXPECT_FALSE(ledger.hasOpenPosition("ETH/USDT"));
}

// -----------------------------------------------------------------------------
// 1. One open position per symbol.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, SecondOpenForSymbolThrows) {
  ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);

  EXPECT_THROW(ledger.open("BTC/USDT", 51000.0, 0.01, 48000.0),
               std::logic_error);
  EXPECT_NO_THROW(ledger.open("ETH/USDT", 3000.0, 0.1, 2850.0));
  EXPECT_EQ(ledger.openPositions().size(), 2u);
}

TEST_F(PositionLedgerTest, NonPositiveInputsThrow) {
  EXPECT_THROW(ledger.open("BTC/USDT", 0.0, 0.01, 1.0), std::invalid_argument);
  EXPECT_THROW(ledger.open("BTC/USDT", 50000.0, -1.0, 1.0),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. 0.01 BTC bought at 50000, marked at 52000: +20.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RevalueComputesUnrealizedPnl) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);

  EXPECT_NEAR(ledger.revalue(pos.id, 52000.0), 20.0, 1e-9);
  EXPECT_NEAR(ledger.unrealizedPnl(), 20.0, 1e-9);

  EXPECT_NEAR(ledger.revalue(pos.id, 49000.0), -10.0, 1e-9);
  EXPECT_DOUBLE_EQ(ledger.position(pos.id)->current_price, 49000.0);
}

TEST_F(PositionLedgerTest, RevalueUnknownIdThrows) {
  EXPECT_THROW(ledger.revalue(42, 1.0), std::out_of_range);
  EXPECT_THROW(ledger.close(42, 1.0), std::out_of_range);
  EXPECT_THROW(ledger.attachStopOrder(42, "x"), std::out_of_range);
}

TEST_F(PositionLedgerTest, AttachStopOrderKeepsId) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);
  EXPECT_TRUE(pos.stop_order_id.empty());

  ledger.attachStopOrder(pos.id, "ex-stop-1");

  EXPECT_EQ(ledger.position(pos.id)->stop_order_id, "ex-stop-1");
  EXPECT_EQ(ledger.openPositions()[0].stop_order_id, "ex-stop-1");
}

// -----------------------------------------------------------------------------
// 3. Closing twice: the second call is a no-op.
// Why: A stop fill and a SELL signal can race for the same position.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, CloseIsOneShot) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);

  auto pnl = ledger.close(pos.id, 52000.0);
  ASSERT_TRUE(pnl.has_value());
  EXPECT_NEAR(*pnl, 20.0, 1e-9);

  EXPECT_FALSE(ledger.close(pos.id, 40000.0).has_value());

  auto closed = ledger.position(pos.id);
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->status, PositionStatus::Closed);
  EXPECT_NEAR(closed->unrealized_pnl, 20.0, 1e-9);
  EXPECT_FALSE(ledger.hasOpenPosition("BTC/USDT"));
  EXPECT_DOUBLE_EQ(ledger.unrealizedPnl(), 0.0);
}

TEST_F(PositionLedgerTest, RevalueAfterCloseReturnsFrozenPnl) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);
  ledger.close(pos.id, 49000.0);

  EXPECT_NEAR(ledger.revalue(pos.id, 60000.0), -10.0, 1e-9);
  EXPECT_DOUBLE_EQ(ledger.position(pos.id)->current_price, 49000.0);
}

// -----------------------------------------------------------------------------
// 4. Stop at 47500: breached at 47000 and exactly at 47500, not at 48000.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, StopLossBreachDetection) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);

  EXPECT_TRUE(ledger.checkStopLossBreaches({{"BTC/USDT", 48000.0}}).empty());

  auto breached = ledger.checkStopLossBreaches({{"BTC/USDT", 47000.0}});
  ASSERT_EQ(breached.size(), 1u);
  EXPECT_EQ(breached[0].id, pos.id);

  EXPECT_EQ(ledger.checkStopLossBreaches({{"BTC/USDT", 47500.0}}).size(), 1u);

  // No price for the symbol: not evaluated.
  EXPECT_TRUE(ledger.checkStopLossBreaches({{"ETH/USDT", 1.0}}).empty());
}

TEST_F(PositionLedgerTest, ClosedPositionsNotReportedAsBreached) {
  auto pos = ledger.open("BTC/USDT", 50000.0, 0.01, 47500.0);
  ledger.close(pos.id, 47000.0);

  EXPECT_TRUE(ledger.checkStopLossBreaches({{"BTC/USDT", 1.0}}).empty());
}

// -----------------------------------------------------------------------------
// 5. Hydrated ids are never reissued.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, HydrateAdvancesIds) {
  autotrader::domain::Position restored;
  restored.id = 7;
  restored.symbol = "BTC/USDT";
  restored.entry_price = 50000.0;
  restored.amount = 0.01;
  restored.stop_loss_price = 47500.0;
  restored.current_price = 51000.0;
  restored.unrealized_pnl = 10.0;

  ledger.hydrate(restored);
  EXPECT_TRUE(ledger.hasOpenPosition("BTC/USDT"));
  EXPECT_THROW(ledger.hydrate(restored), std::logic_error);

  auto next = ledger.open("ETH/USDT", 3000.0, 0.1, 2850.0);
  EXPECT_GT(next.id, 7u);
}

TEST_F(PositionLedgerTest, HydrateRejectsClosedPosition) {
  autotrader::domain::Position closed;
  closed.id = 3;
  closed.symbol = "BTC/USDT";
  closed.entry_price = 50000.0;
  closed.amount = 0.01;
  closed.status = PositionStatus::Closed;

  EXPECT_THROW(ledger.hydrate(closed), std::invalid_argument);
}
