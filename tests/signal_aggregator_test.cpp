// =============================================================================
// signal_aggregator_test.cpp
// =============================================================================
// Unit tests for autotrader::SignalAggregator.
//
// Validates:
//   - Weighted buckets and strict-winner selection
//   - Ties resolve to HOLD
//   - Sub-threshold BUY/SELL downgraded to HOLD with an explanatory note
//   - Disabled and throwing sources excluded from the vote
//   - Registry validation (duplicates, weight range, unknown names)
// =============================================================================

#include "autotrader/strategy/signal_aggregator.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using autotrader::SignalAggregator;
using autotrader::domain::Direction;
using autotrader::domain::WeightedOpinion;
using autotrader::testing::FakeModule;

namespace {

WeightedOpinion opinion(const std::string& name, double weight,
                        Direction direction, double confidence,
                        bool enabled = true) {
  WeightedOpinion op;
  op.source_name = name;
  op.weight = weight;
  op.signal.direction = direction;
  op.signal.confidence = confidence;
  op.signal.rationale = name + " says so";
  op.enabled = enabled;
  return op;
}

}  // namespace

// =============================================================================
// Test fixture: an aggregator with threshold 0 so combine() outcomes are not
// masked by the downgrade, plus a snapshot to evaluate against.
// =============================================================================
class SignalAggregatorTest : public ::testing::Test {
 protected:
  SignalAggregator aggregator{0.0};
  autotrader::domain::MarketSnapshot snapshot;

  void SetUp() override {
    snapshot.symbol = "BTC/USDT";
    snapshot.price = 50000.0;
  }
};

// -----------------------------------------------------------------------------
// 1. BUY 80 @ 0.5 against SELL 60 @ 0.3: BUY wins with score 40.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, WeightedBuyWins) {
  auto s = SignalAggregator::combine(
      {opinion("ta", 0.5, Direction::Buy, 80.0),
       opinion("news", 0.3, Direction::Sell, 60.0)},
      0.0);

  EXPECT_EQ(s.direction, Direction::Buy);
  EXPECT_DOUBLE_EQ(s.confidence, 40.0);
}

// -----------------------------------------------------------------------------
// 2. Equal BUY and SELL scores tie, and a tie is HOLD.
// Why: Never trade on an undecided vote.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, TieResolvesToHold) {
  auto s = SignalAggregator::combine(
      {opinion("a", 0.5, Direction::Buy, 80.0),
       opinion("b", 0.5, Direction::Sell, 80.0)},
      0.0);

  EXPECT_EQ(s.direction, Direction::Hold);
  EXPECT_DOUBLE_EQ(s.confidence, 40.0);
}

TEST_F(SignalAggregatorTest, HoldWinsOutright) {
  auto s = SignalAggregator::combine(
      {opinion("a", 1.0, Direction::Hold, 90.0),
       opinion("b", 0.2, Direction::Buy, 100.0)},
      0.0);

  EXPECT_EQ(s.direction, Direction::Hold);
  EXPECT_DOUBLE_EQ(s.confidence, 90.0);
}

// -----------------------------------------------------------------------------
// 3. A winning BUY below the threshold becomes HOLD and says why.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, BelowThresholdDowngradedToHold) {
  auto s = SignalAggregator::combine(
      {opinion("ta", 0.5, Direction::Buy, 80.0)}, 70.0);

  EXPECT_EQ(s.direction, Direction::Hold);
  EXPECT_DOUBLE_EQ(s.confidence, 40.0);
  EXPECT_NE(s.rationale.find("downgraded to HOLD"), std::string::npos);
  EXPECT_NE(s.rationale.find("BUY score 40.00 below threshold 70.00"),
            std::string::npos);
}

TEST_F(SignalAggregatorTest, AtThresholdIsKept) {
  auto s = SignalAggregator::combine(
      {opinion("ta", 1.0, Direction::Sell, 70.0)}, 70.0);

  EXPECT_EQ(s.direction, Direction::Sell);
  EXPECT_DOUBLE_EQ(s.confidence, 70.0);
}

// -----------------------------------------------------------------------------
// 4. No enabled sources: HOLD at zero confidence.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, NoActiveSourcesIsHoldZero) {
  auto empty = SignalAggregator::combine({}, 0.0);
  EXPECT_EQ(empty.direction, Direction::Hold);
  EXPECT_DOUBLE_EQ(empty.confidence, 0.0);
  EXPECT_EQ(empty.rationale, "no active sources");

  auto disabled = SignalAggregator::combine(
      {opinion("a", 1.0, Direction::Buy, 100.0, false)}, 0.0);
  EXPECT_EQ(disabled.direction, Direction::Hold);
  EXPECT_DOUBLE_EQ(disabled.confidence, 0.0);
}

TEST_F(SignalAggregatorTest, RationaleJoinsSourcesInOrder) {
  auto s = SignalAggregator::combine(
      {opinion("first", 0.5, Direction::Buy, 80.0),
       opinion("skipped", 0.5, Direction::Buy, 80.0, false),
       opinion("second", 0.3, Direction::Sell, 60.0)},
      0.0);

  EXPECT_EQ(s.rationale, "first: first says so | second: second says so");
}

// Scores above 100 are possible when weights sum past 1.
TEST_F(SignalAggregatorTest, ConfidenceCappedAtHundred) {
  auto s = SignalAggregator::combine(
      {opinion("a", 1.0, Direction::Buy, 90.0),
       opinion("b", 1.0, Direction::Buy, 90.0)},
      0.0);

  EXPECT_EQ(s.direction, Direction::Buy);
  EXPECT_DOUBLE_EQ(s.confidence, 100.0);
}

// -----------------------------------------------------------------------------
// 5. evaluate() runs enabled modules only and reports each opinion.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, EvaluateSkipsDisabledModules) {
  auto buyer = std::make_shared<FakeModule>("buyer", Direction::Buy, 80.0);
  auto seller = std::make_shared<FakeModule>("seller", Direction::Sell, 90.0);
  aggregator.registerSource(buyer, 0.5);
  aggregator.registerSource(seller, 0.5, false);

  auto result = aggregator.evaluate(snapshot);

  EXPECT_EQ(buyer->calls, 1);
  EXPECT_EQ(seller->calls, 0);
  ASSERT_EQ(result.opinions.size(), 2u);
  EXPECT_FALSE(result.opinions[1].enabled);
  EXPECT_EQ(result.combined.direction, Direction::Buy);
  EXPECT_DOUBLE_EQ(result.combined.confidence, 40.0);
}

// -----------------------------------------------------------------------------
// 6. A throwing module is dropped for this cycle only.
// Why: One broken indicator must not take the whole engine down.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, ThrowingModuleExcludedForCycle) {
  auto good = std::make_shared<FakeModule>("good", Direction::Sell, 80.0);
  auto bad = std::make_shared<FakeModule>("bad", Direction::Buy, 100.0);
  bad->throws = true;
  aggregator.registerSource(good, 1.0);
  aggregator.registerSource(bad, 1.0);

  auto result = aggregator.evaluate(snapshot);
  EXPECT_EQ(result.combined.direction, Direction::Sell);
  EXPECT_FALSE(result.opinions[1].enabled);

  // Still registered and enabled for the next cycle.
  bad->throws = false;
  auto next = aggregator.evaluate(snapshot);
  EXPECT_EQ(next.combined.direction, Direction::Buy);
  EXPECT_TRUE(aggregator.sources()[1].enabled);
}

TEST_F(SignalAggregatorTest, OutOfRangeConfidenceTreatedAsFailure) {
  auto liar = std::make_shared<FakeModule>("liar", Direction::Buy, 150.0);
  aggregator.registerSource(liar, 1.0);

  auto result = aggregator.evaluate(snapshot);

  EXPECT_EQ(result.combined.direction, Direction::Hold);
  EXPECT_EQ(result.combined.rationale, "no active sources");
}

// -----------------------------------------------------------------------------
// 7. Registry validation.
// -----------------------------------------------------------------------------
TEST_F(SignalAggregatorTest, RegistryRejectsBadInput) {
  aggregator.registerSource(std::make_shared<FakeModule>("ta"), 0.5);

  EXPECT_THROW(aggregator.registerSource(std::make_shared<FakeModule>("ta"), 0.5),
               std::invalid_argument);
  EXPECT_THROW(aggregator.registerSource(std::make_shared<FakeModule>("x"), 1.5),
               std::invalid_argument);
  EXPECT_THROW(aggregator.registerSource(nullptr, 0.5), std::invalid_argument);
  EXPECT_THROW(aggregator.setWeight("ta", -0.1), std::invalid_argument);

  EXPECT_EQ(aggregator.sources().size(), 1u);
}

TEST_F(SignalAggregatorTest, RegistryUpdatesByName) {
  aggregator.registerSource(std::make_shared<FakeModule>("ta"), 0.5);

  EXPECT_TRUE(aggregator.setWeight("ta", 0.8));
  EXPECT_TRUE(aggregator.disable("ta"));
  EXPECT_FALSE(aggregator.setWeight("missing", 0.1));
  EXPECT_FALSE(aggregator.enable("missing"));

  auto sources = aggregator.sources();
  ASSERT_EQ(sources.size(), 1u);
  EXPECT_EQ(sources[0].name, "ta");
  EXPECT_DOUBLE_EQ(sources[0].weight, 0.8);
  EXPECT_FALSE(sources[0].enabled);

  EXPECT_TRUE(aggregator.enable("ta"));
  EXPECT_TRUE(aggregator.sources()[0].enabled);
}
