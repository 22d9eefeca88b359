// =============================================================================
// portfolio_test.cpp
// =============================================================================
// Unit tests for tradegate::Portfolio (local long/short mirror).
//
// Validates:
//   - Long buy: weighted cost basis, cash debit
//   - Long sell: realized gain, capped at the held quantity
//   - Short open / cover: margin reservation, proportional release,
//     realized gain on cover
//   - applyFill routing by action
//   - hydrate() from broker positions and reconcile() discrepancies
// =============================================================================

#include "tradegate/portfolio/portfolio.hpp"

#include <gtest/gtest.h>

#include <vector>

using tradegate::FillEffect;
using tradegate::Portfolio;
using tradegate::domain::Position;
using tradegate::domain::TradeAction;

namespace {

Position brokerPosition(const std::string& symbol, std::int64_t qty,
                        double avg_cost) {
  Position p;
  p.symbol = symbol;
  p.quantity = qty;
  p.avg_cost = avg_cost;
  return p;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Long leg
// -----------------------------------------------------------------------------
TEST(PortfolioTest, LongBuyAveragesCostAndDebitsCash) {
  Portfolio portfolio(10'000.0);
  portfolio.applyLongBuy("AAPL", 10, 100.0);
  portfolio.applyLongBuy("AAPL", 10, 120.0);

  EXPECT_EQ(portfolio.longShares("AAPL"), 20);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 10'000.0 - 2'200.0);
  EXPECT_DOUBLE_EQ(portfolio.snapshot().positions.at("AAPL").long_cost_basis,
                   110.0);
}

TEST(PortfolioTest, LongSellRealizesGain) {
  Portfolio portfolio(10'000.0);
  portfolio.applyLongBuy("AAPL", 10, 100.0);
  FillEffect effect = portfolio.applyLongSell("AAPL", 4, 130.0);

  EXPECT_EQ(effect.applied_qty, 4);
  EXPECT_DOUBLE_EQ(effect.realized_pnl, 120.0);
  EXPECT_EQ(portfolio.longShares("AAPL"), 6);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 10'000.0 - 1'000.0 + 520.0);
  EXPECT_DOUBLE_EQ(portfolio.totalRealizedGains(), 120.0);
}

TEST(PortfolioTest, LongSellIsCappedAtHolding) {
  Portfolio portfolio(10'000.0);
  portfolio.applyLongBuy("AAPL", 3, 100.0);
  FillEffect effect = portfolio.applyLongSell("AAPL", 5, 90.0);

  EXPECT_EQ(effect.applied_qty, 3);
  EXPECT_DOUBLE_EQ(effect.realized_pnl, -30.0);
  EXPECT_EQ(portfolio.longShares("AAPL"), 0);
}

TEST(PortfolioTest, SellWithoutHoldingChangesNothing) {
  Portfolio portfolio(10'000.0);
  FillEffect effect = portfolio.applyLongSell("AAPL", 5, 90.0);
  EXPECT_EQ(effect.applied_qty, 0);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 10'000.0);
}

// -----------------------------------------------------------------------------
// 2. Short leg
// -----------------------------------------------------------------------------
TEST(PortfolioTest, ShortOpenReservesMargin) {
  Portfolio portfolio(10'000.0, 0.5);
  portfolio.applyShortOpen("TSLA", 10, 200.0);

  EXPECT_EQ(portfolio.shortShares("TSLA"), 10);
  EXPECT_DOUBLE_EQ(portfolio.marginUsed(), 1'000.0);
  // +2,000 proceeds − 1,000 margin.
  EXPECT_DOUBLE_EQ(portfolio.cash(), 11'000.0);
}

TEST(PortfolioTest, ShortCoverReleasesMarginAndRealizesGain) {
  Portfolio portfolio(10'000.0, 0.5);
  portfolio.applyShortOpen("TSLA", 10, 200.0);
  FillEffect effect = portfolio.applyShortCover("TSLA", 5, 180.0);

  EXPECT_EQ(effect.applied_qty, 5);
  EXPECT_DOUBLE_EQ(effect.realized_pnl, 100.0);
  EXPECT_EQ(portfolio.shortShares("TSLA"), 5);
  EXPECT_DOUBLE_EQ(portfolio.marginUsed(), 500.0);
  // 11,000 + 500 released − 900 paid.
  EXPECT_DOUBLE_EQ(portfolio.cash(), 10'600.0);
}

TEST(PortfolioTest, FullCoverClearsShortLeg) {
  Portfolio portfolio(10'000.0, 0.5);
  portfolio.applyShortOpen("TSLA", 10, 200.0);
  portfolio.applyShortCover("TSLA", 10, 210.0);

  EXPECT_EQ(portfolio.shortShares("TSLA"), 0);
  EXPECT_DOUBLE_EQ(portfolio.marginUsed(), 0.0);
  EXPECT_DOUBLE_EQ(portfolio.totalRealizedGains(), -100.0);
}

// -----------------------------------------------------------------------------
// 3. applyFill routing
// -----------------------------------------------------------------------------
TEST(PortfolioTest, ApplyFillRoutesByAction) {
  Portfolio portfolio(10'000.0);
  portfolio.applyFill(TradeAction::Buy, "AAPL", 2, 100.0);
  portfolio.applyFill(TradeAction::Short, "AAPL", 3, 100.0);
  EXPECT_EQ(portfolio.longShares("AAPL"), 2);
  EXPECT_EQ(portfolio.shortShares("AAPL"), 3);

  FillEffect hold = portfolio.applyFill(TradeAction::Hold, "AAPL", 5, 100.0);
  EXPECT_EQ(hold.applied_qty, 0);
}

// -----------------------------------------------------------------------------
// 4. hydrate / reconcile
// -----------------------------------------------------------------------------
TEST(PortfolioTest, HydrateSplitsLongAndShort) {
  Portfolio portfolio(0.0, 0.5);
  portfolio.hydrate({brokerPosition("AAPL", 10, 150.0),
                     brokerPosition("TSLA", -4, 200.0)},
                    50'000.0);

  EXPECT_EQ(portfolio.longShares("AAPL"), 10);
  EXPECT_EQ(portfolio.shortShares("TSLA"), 4);
  EXPECT_DOUBLE_EQ(portfolio.marginUsed(), 400.0);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 50'000.0);
  EXPECT_TRUE(portfolio.reconcile({brokerPosition("AAPL", 10, 150.0),
                                   brokerPosition("TSLA", -4, 200.0)})
                  .empty());
}

TEST(PortfolioTest, ReconcileListsDifferences) {
  Portfolio portfolio(10'000.0);
  portfolio.applyLongBuy("AAPL", 10, 100.0);

  auto diffs = portfolio.reconcile({brokerPosition("AAPL", 7, 100.0),
                                    brokerPosition("MSFT", 2, 300.0)});
  ASSERT_EQ(diffs.size(), 2u);
  EXPECT_EQ(diffs[0].symbol, "AAPL");
  EXPECT_EQ(diffs[0].local_qty, 10);
  EXPECT_EQ(diffs[0].broker_qty, 7);
  EXPECT_EQ(diffs[1].symbol, "MSFT");
  EXPECT_EQ(diffs[1].local_qty, 0);
}

TEST(PortfolioTest, JsonShape) {
  Portfolio portfolio(1'000.0);
  portfolio.applyLongBuy("AAPL", 1, 100.0);
  const auto j = portfolio.toJson();
  EXPECT_DOUBLE_EQ(j.at("cash").get<double>(), 900.0);
  EXPECT_EQ(j.at("positions").at("AAPL").at("long").get<int>(), 1);
  EXPECT_TRUE(j.contains("realized_gains"));
}
