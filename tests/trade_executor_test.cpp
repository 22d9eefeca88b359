// =============================================================================
// trade_executor_test.cpp
// =============================================================================
// Unit and end-to-end tests for tradegate::TradeExecutor.
//
// Validates:
//   - hold / quantity <= 0 / unknown action: 0 executed, broker untouched
//   - Dry-run buy through SimulatedBroker: full fill, portfolio cash moves
//     by notional with slippage plus commission, daily trades + 1
//   - Sell with no holding and short selling disabled: rejected before
//     submit
//   - Risk rejection, buying power, max_order_value and disconnected broker
//     all record a failed trade and return 0
//   - Unknown caller price: broker quote drives every check, no quote
//     rejects with a DataError
//   - Partial and zero fills from the broker
//   - Reports: executionReport(), accountSummary(), validateTradingSession()
// =============================================================================

#include "tradegate/broker/simulated_broker.hpp"
#include "tradegate/execution/trade_executor.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include "scripted_broker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using tradegate::Portfolio;
using tradegate::RiskManager;
using tradegate::SimulatedBroker;
using tradegate::TradeConfig;
using tradegate::TradeExecutor;
using tradegate::domain::OrderStatus;
using tradegate::domain::RiskLimits;
using tradegate::test::ScriptedBroker;
using tradegate::test::cashAccount;

// =============================================================================
// Fixture: executor over a ScriptedBroker (submits are counted).
// =============================================================================
class TradeExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    broker.account = cashAccount(100'000.0);
    broker.fill_price = 150.0;
    broker.commission = 1.5;
    broker.connect();
  }

  TradeExecutor& executor() {
    if (!executor_) {
      risk_ = std::make_unique<RiskManager>(limits, clock);
      executor_ =
          std::make_unique<TradeExecutor>(broker, *risk_, config, clock);
    }
    return *executor_;
  }
  RiskManager& risk() {
    executor();
    return *risk_;
  }

  tradegate::SimulationTimeProvider clock{1'700'000'000'000};
  TradeConfig config;
  RiskLimits limits;
  ScriptedBroker broker;
  Portfolio portfolio{100'000.0};

 private:
  std::unique_ptr<RiskManager> risk_;
  std::unique_ptr<TradeExecutor> executor_;
};

// -----------------------------------------------------------------------------
// 1. No order, no broker contact
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, HoldAndZeroQuantityNeverReachBroker) {
  EXPECT_EQ(executor().execute("AAPL", "hold", 10, 150.0, portfolio), 0);
  EXPECT_EQ(executor().execute("AAPL", "buy", 0, 150.0, portfolio), 0);
  EXPECT_EQ(executor().execute("AAPL", "buy", -3, 150.0, portfolio), 0);
  EXPECT_EQ(executor().execute("AAPL", "bogus", 3, 150.0, portfolio), 0);

  EXPECT_EQ(broker.submit_calls, 0);
  EXPECT_EQ(executor().totalTrades(), 0);
  EXPECT_TRUE(executor().recentFailures().empty());
}

// -----------------------------------------------------------------------------
// 2. Successful execution books the fill once
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, FilledBuyUpdatesPortfolioAndRisk) {
  const auto qty = executor().execute("AAPL", "buy", 10, 150.0, portfolio);

  EXPECT_EQ(qty, 10);
  EXPECT_EQ(broker.submit_calls, 1);
  EXPECT_EQ(portfolio.longShares("AAPL"), 10);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 100'000.0 - 1'500.0 - 1.5);
  EXPECT_EQ(risk().dailyTrades(), 1);
  EXPECT_DOUBLE_EQ(risk().dailyPnl(), -1.5);
  EXPECT_EQ(executor().successfulTrades(), 1);
  ASSERT_EQ(executor().executionHistory().size(), 1u);

  ASSERT_EQ(broker.submitted.size(), 1u);
  ASSERT_TRUE(broker.submitted[0].price().has_value());
  EXPECT_DOUBLE_EQ(*broker.submitted[0].price(), 150.0);
}

TEST_F(TradeExecutorTest, SellRealizesGainIntoRiskPnl) {
  broker.positions = {[] {
    tradegate::domain::Position p;
    p.symbol = "AAPL";
    p.quantity = 10;
    p.market_price = 150.0;
    return p;
  }()};
  portfolio.applyLongBuy("AAPL", 10, 140.0);

  EXPECT_EQ(executor().execute("AAPL", "sell", 10, 150.0, portfolio), 10);
  EXPECT_DOUBLE_EQ(risk().dailyPnl(), 100.0 - 1.5);
  EXPECT_EQ(portfolio.longShares("AAPL"), 0);
}

TEST_F(TradeExecutorTest, PartialFillAppliesFilledQuantityOnly) {
  broker.fill_whole = false;
  broker.fill.order_id = "P-1";
  broker.fill.status = OrderStatus::PartiallyFilled;
  broker.fill.filled_quantity = 4;
  broker.fill.avg_price = 149.0;

  EXPECT_EQ(executor().execute("AAPL", "buy", 10, 150.0, portfolio), 4);
  EXPECT_EQ(portfolio.longShares("AAPL"), 4);
  EXPECT_DOUBLE_EQ(portfolio.cash(), 100'000.0 - 4 * 149.0);
}

TEST_F(TradeExecutorTest, ZeroFillRecordsFailure) {
  broker.fill_whole = false;
  broker.fill.status = OrderStatus::Rejected;
  broker.fill.error_msg = "market closed";

  EXPECT_EQ(executor().execute("AAPL", "buy", 10, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 1);
  EXPECT_EQ(portfolio.longShares("AAPL"), 0);
  EXPECT_EQ(risk().dailyTrades(), 0);

  auto failures = executor().recentFailures();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].ticker, "AAPL");
  EXPECT_EQ(failures[0].requested_qty, 10);
  EXPECT_EQ(failures[0].executed_qty, 0);
  EXPECT_EQ(failures[0].error, "market closed");
}

// -----------------------------------------------------------------------------
// 3. Pre-trade rejections (no submit)
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, SellWithoutSharesRejectedWhenShortingDisabled) {
  EXPECT_EQ(executor().execute("AAPL", "sell", 100, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);

  auto failures = executor().recentFailures();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_NE(failures[0].error.find("Insufficient shares"), std::string::npos);
}

TEST_F(TradeExecutorTest, ShortAllowedWhenShortingEnabled) {
  config.enable_short_selling = true;
  EXPECT_EQ(executor().execute("AAPL", "short", 5, 150.0, portfolio), 5);
  EXPECT_EQ(portfolio.shortShares("AAPL"), 5);
}

TEST_F(TradeExecutorTest, RiskRejectionSkipsSubmit) {
  risk().updatePnl(-limits.max_daily_loss - 1.0);

  EXPECT_EQ(executor().execute("AAPL", "buy", 1, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  auto failures = executor().recentFailures();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_NE(failures[0].error.find("Circuit breaker"), std::string::npos);
}

TEST_F(TradeExecutorTest, InsufficientBuyingPowerRejected) {
  broker.account.buying_power = 1'000.0;
  EXPECT_EQ(executor().execute("AAPL", "buy", 10, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  EXPECT_NE(executor().recentFailures()[0].error.find("buying power"),
            std::string::npos);
}

TEST_F(TradeExecutorTest, MaxOrderValueRejected) {
  config.max_order_value = 1'000.0;
  EXPECT_EQ(executor().execute("AAPL", "buy", 10, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  EXPECT_NE(executor().recentFailures()[0].error.find("exceeds maximum"),
            std::string::npos);
}

TEST_F(TradeExecutorTest, DisconnectedBrokerRejected) {
  broker.disconnect();
  EXPECT_EQ(executor().execute("AAPL", "buy", 1, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  EXPECT_NE(executor().recentFailures()[0].error.find("ConnectionError"),
            std::string::npos);
}

TEST_F(TradeExecutorTest, AccountSnapshotFailureRejected) {
  broker.account_error = true;
  EXPECT_EQ(executor().execute("AAPL", "buy", 1, 150.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
}

TEST_F(TradeExecutorTest, UnknownPriceIsQuotedBeforeFundsChecks) {
  broker.prices["AAPL"] = 150.0;
  // 900 × 150 = 135,000: over buying power and over max_order_value.
  EXPECT_EQ(executor().execute("AAPL", "buy", 900, 0.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  ASSERT_EQ(executor().recentFailures().size(), 1u);
  EXPECT_DOUBLE_EQ(executor().recentFailures()[0].price, 150.0);
}

TEST_F(TradeExecutorTest, UnknownPriceWithoutQuoteRejected) {
  EXPECT_EQ(executor().execute("AAPL", "buy", 1, 0.0, portfolio), 0);
  EXPECT_EQ(broker.submit_calls, 0);
  ASSERT_EQ(executor().recentFailures().size(), 1u);
  EXPECT_NE(executor().recentFailures()[0].error.find("DataError"),
            std::string::npos);
}

TEST_F(TradeExecutorTest, QuotedPriceIsAttachedToOrder) {
  broker.prices["AAPL"] = 150.0;
  EXPECT_EQ(executor().execute("AAPL", "buy", 10, -1.0, portfolio), 10);
  ASSERT_EQ(broker.submitted.size(), 1u);
  ASSERT_TRUE(broker.submitted[0].price().has_value());
  EXPECT_DOUBLE_EQ(*broker.submitted[0].price(), 150.0);
}

// -----------------------------------------------------------------------------
// 4. Reports
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, ExecutionReportCountsOutcomes) {
  executor().execute("AAPL", "buy", 10, 150.0, portfolio);
  executor().execute("AAPL", "sell", 999, 150.0, portfolio);

  const auto report = executor().executionReport();
  EXPECT_EQ(report.at("total_trades").get<int>(), 2);
  EXPECT_EQ(report.at("successful_trades").get<int>(), 1);
  EXPECT_EQ(report.at("failed_trades").get<int>(), 1);
  EXPECT_DOUBLE_EQ(report.at("success_rate").get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(report.at("total_executed_value").get<double>(), 1'500.0);
  EXPECT_DOUBLE_EQ(report.at("total_commission").get<double>(), 1.5);
  EXPECT_EQ(report.at("recent_failures").size(), 1u);
}

TEST_F(TradeExecutorTest, RecentFailuresCappedAtTen) {
  for (int i = 0; i < 15; ++i) {
    executor().execute("AAPL", "sell", 1, 150.0, portfolio);
  }
  EXPECT_EQ(executor().recentFailures().size(), 10u);
  EXPECT_EQ(executor().executionReport().at("recent_failures").size(), 10u);
  EXPECT_EQ(executor().executionReport().at("failed_trades").get<int>(), 15);
}

TEST_F(TradeExecutorTest, AccountSummaryReportsBrokerErrors) {
  broker.account_error = true;
  const auto summary = executor().accountSummary();
  EXPECT_TRUE(summary.at("account_info").is_null());
  EXPECT_TRUE(summary.at("positions").is_array());
  EXPECT_EQ(summary.at("errors").size(), 1u);
  EXPECT_TRUE(summary.contains("trade_summary"));
  EXPECT_TRUE(summary.contains("execution_stats"));
}

TEST_F(TradeExecutorTest, SessionReadiness) {
  EXPECT_TRUE(executor().validateTradingSession().ready);

  broker.account.buying_power = 0.0;
  auto ready = executor().validateTradingSession();
  EXPECT_FALSE(ready.ready);
  EXPECT_EQ(ready.message, "No buying power available");

  broker.disconnect();
  EXPECT_FALSE(executor().validateTradingSession().ready);
}

// =============================================================================
// End-to-end over the dry-run SimulatedBroker
// =============================================================================
class DryRunExecutionTest : public ::testing::Test {
 protected:
  tradegate::SimulationTimeProvider clock{1'700'000'000'000};
  TradeConfig config;  // dry_run, slippage 0.001, commission 0.001 / min 1
  RiskManager risk{RiskLimits{}, clock};
  SimulatedBroker broker{config, clock};
  TradeExecutor executor{broker, risk, config, clock};
  Portfolio portfolio{100'000.0};
};

TEST_F(DryRunExecutionTest, BuyTenAaplAtOneFifty) {
  ASSERT_TRUE(executor.connect());

  const double cash_before = portfolio.cash();
  const auto qty = executor.execute("AAPL", "buy", 10, 150.0, portfolio);

  EXPECT_EQ(qty, 10);
  const double fill = 150.0 * (1.0 + config.slippage);
  const double commission =
      std::max(config.min_commission, config.commission_rate * 10 * fill);
  EXPECT_NEAR(cash_before - portfolio.cash(), 10 * fill + commission, 1e-6);
  EXPECT_EQ(risk.dailyTrades(), 1);

  auto history = executor.executionHistory();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].status, OrderStatus::Filled);
  EXPECT_EQ(history[0].filled_quantity, 10);
  EXPECT_GT(*history[0].avg_price, 150.0);
}

TEST_F(DryRunExecutionTest, SellWithNoPositionNeverSubmits) {
  ASSERT_TRUE(executor.connect());

  EXPECT_EQ(executor.execute("AAPL", "sell", 100, 150.0, portfolio), 0);
  EXPECT_TRUE(executor.executionHistory().empty());
  EXPECT_EQ(risk.dailyTrades(), 0);

  // The simulated broker never saw an order.
  EXPECT_FALSE(broker.getOrderStatus("SIM-000001").ok());
  auto account = broker.getAccountInfo();
  ASSERT_TRUE(account.ok());
  EXPECT_DOUBLE_EQ(account.value().cash, config.paper_starting_cash);
}
