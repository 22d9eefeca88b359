// =============================================================================
// decisions_test.cpp
// =============================================================================
// Unit tests for decision batch parsing (tradegate::domain::parseDecisions).
// =============================================================================

#include "tradegate/domain/trading_decision.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using tradegate::domain::DecisionBatch;
using tradegate::domain::TradeAction;
using tradegate::domain::parseDecisions;
using tradegate::domain::parseTradeAction;

TEST(DecisionsTest, ParsesActionsAndQuantities) {
  const auto batch = parseDecisions(nlohmann::json::parse(R"({
    "AAPL": {"action": "buy", "quantity": 10, "confidence": 82.5,
             "reasoning": "momentum"},
    "TSLA": {"action": "SHORT", "quantity": 3}
  })"));

  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch.at("AAPL").action, TradeAction::Buy);
  EXPECT_EQ(batch.at("AAPL").quantity, 10);
  EXPECT_DOUBLE_EQ(batch.at("AAPL").confidence, 82.5);
  EXPECT_EQ(batch.at("AAPL").reasoning, "momentum");
  EXPECT_EQ(batch.at("TSLA").action, TradeAction::Short);
}

TEST(DecisionsTest, UnknownActionAndBadEntryBecomeHold) {
  const auto batch = parseDecisions(nlohmann::json::parse(R"({
    "AAPL": {"action": "moon", "quantity": 10},
    "MSFT": 42,
    "NVDA": {"quantity": 5}
  })"));

  EXPECT_EQ(batch.at("AAPL").action, TradeAction::Hold);
  EXPECT_EQ(batch.at("MSFT").action, TradeAction::Hold);
  EXPECT_EQ(batch.at("NVDA").action, TradeAction::Hold);
}

TEST(DecisionsTest, MistypedFieldsBecomeHoldWithoutThrowing) {
  DecisionBatch batch;
  EXPECT_NO_THROW(batch = parseDecisions(nlohmann::json::parse(R"({
    "AAPL": {"action": "buy", "quantity": 10},
    "MSFT": {"action": 7, "quantity": 10},
    "NVDA": {"action": "buy", "quantity": 2.5},
    "TSLA": {"action": "buy", "quantity": "10"},
    "AMD":  {"action": "buy", "quantity": 18446744073709551615},
    "META": {"action": "sell", "quantity": 4, "reasoning": 12}
  })")));

  ASSERT_EQ(batch.size(), 6u);
  EXPECT_EQ(batch.at("AAPL").action, TradeAction::Buy);
  for (const char* ticker : {"MSFT", "NVDA", "TSLA", "AMD"}) {
    EXPECT_EQ(batch.at(ticker).action, TradeAction::Hold) << ticker;
    EXPECT_EQ(batch.at(ticker).quantity, 0) << ticker;
  }
  EXPECT_EQ(batch.at("META").action, TradeAction::Sell);
  EXPECT_EQ(batch.at("META").quantity, 4);
  EXPECT_TRUE(batch.at("META").reasoning.empty());
}

TEST(DecisionsTest, NonObjectBatchThrows) {
  EXPECT_THROW(parseDecisions(nlohmann::json::array()),
               std::invalid_argument);
}

TEST(DecisionsTest, ParseTradeActionRejectsUnknown) {
  EXPECT_EQ(parseTradeAction("Cover").value_or(TradeAction::Hold),
            TradeAction::Cover);
  EXPECT_FALSE(parseTradeAction("").has_value());
}
