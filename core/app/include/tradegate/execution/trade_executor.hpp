#pragma once

#include "tradegate/broker/i_broker.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/execution/order_translator.hpp"
#include "tradegate/portfolio/portfolio.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// One entry of the bounded failed-trade log.
struct FailedTrade {
  std::int64_t timestamp_ms{0};
  std::string ticker;
  std::string action;
  std::int64_t requested_qty{0};
  std::int64_t executed_qty{0};
  double price{0.0};
  std::string error;
};

// Readiness of the broker session (validateTradingSession()).
struct SessionReadiness {
  bool ready{false};
  std::string message;
};

// -----------------------------------------------------------------------------
// TradeExecutor
// -----------------------------------------------------------------------------
//
// @brief  Runs one decision through translate → validate → submit →
//         book, and reports how many shares were actually executed.
//
// @details
// execute() sequence:
//   1. OrderTranslator::translate(). No order (hold, qty <= 0, unknown
//      action) → return 0; the broker is not contacted.
//   2. current_price <= 0: the broker is quoted and the quote becomes the
//      order's price. No quote → rejected with a DataError.
//   3. Pre-trade validation, first failure wins:
//        connected → account snapshot → positions snapshot →
//        RiskManager::validateOrder → buying power (BUY) →
//        held shares (SELL, unless short selling is enabled) →
//        max_order_value
//   4. IBroker::submitOrder().
//   5. filled_quantity > 0: the fill (executed qty, avg_price) is applied to
//      the Portfolio once, commission is charged, the risk manager records
//      the trade and receives realized P&L minus commission, and the result
//      joins the execution history.
//      filled_quantity == 0: a FailedTrade entry with the broker error.
//
// No exception escapes execute(); any std::exception is logged as a failed
// trade and 0 is returned. The failed-trade log keeps the latest
// kMaxFailedTrades entries; reports expose the last 10.
//
// Thread model:
//   Counters and logs are guarded by stats_mutex_, never held across a
//   broker call. Callers that want deterministic risk counters run tickers
//   one at a time (TradingSession does).
//
// Ownership:
//   Borrows the broker, risk manager and time provider; all must outlive
//   the executor. The portfolio is passed per call.
// -----------------------------------------------------------------------------
class TradeExecutor {
 public:
  static constexpr std::size_t kMaxFailedTrades = 1000;
  static constexpr std::size_t kRecentFailures = 10;

  TradeExecutor(IBroker& broker, RiskManager& risk, const TradeConfig& config,
                const ITimeProvider& clock);

  TradeExecutor(const TradeExecutor&) = delete;
  TradeExecutor& operator=(const TradeExecutor&) = delete;
  TradeExecutor(TradeExecutor&&) = delete;
  TradeExecutor& operator=(TradeExecutor&&) = delete;

  bool connect();
  bool disconnect();

  // -------------------------------------------------------------------------
  // execute(ticker, action, quantity, current_price, portfolio)
  // -------------------------------------------------------------------------
  // @param  action         buy | sell | short | cover | hold
  // @param  current_price  Latest known price. Attached to the order for
  //                        risk and funds estimates; <= 0 means unknown
  //                        and the broker is quoted instead.
  // @return Shares actually executed, 0 on any rejection or failure.
  // -------------------------------------------------------------------------
  std::int64_t execute(const std::string& ticker, const std::string& action,
                       std::int64_t quantity, double current_price,
                       Portfolio& portfolio);

  // Connected, account readable, buying power > 0.
  SessionReadiness validateTradingSession();

  // -------------------------------------------------------------------------
  // executionReport()
  // -------------------------------------------------------------------------
  // {total_trades, successful_trades, failed_trades, success_rate,
  //  total_executed_value, total_commission, recent_failures[<=10]}
  // -------------------------------------------------------------------------
  nlohmann::json executionReport() const;

  // Summary over every broker submission:
  // {total_trades, successful_trades, failed_trades, success_rate}
  nlohmann::json tradeSummary() const;

  // {account_info, positions, trade_summary, execution_stats, errors}.
  // Broker failures leave the affected field null and add to errors.
  nlohmann::json accountSummary();

  std::vector<FailedTrade> recentFailures(
      std::size_t n = kRecentFailures) const;
  std::vector<domain::TradeResult> executionHistory() const;

  std::int64_t totalTrades() const;
  std::int64_t successfulTrades() const;

  IBroker& broker() { return broker_; }

 private:
  // Returns the rejection reason, or nullopt when the order may be sent.
  std::optional<std::string> preTradeCheck(const domain::Order& order,
                                           double price);

  void recordFailure(const std::string& ticker, const std::string& action,
                     std::int64_t requested, std::int64_t executed,
                     double price, const std::string& error);

  IBroker& broker_;
  RiskManager& risk_;
  const TradeConfig config_;
  const ITimeProvider& clock_;
  const OrderTranslator translator_{};

  mutable std::mutex stats_mutex_;
  std::int64_t total_trades_{0};
  std::int64_t successful_trades_{0};
  std::int64_t failed_count_{0};
  std::vector<domain::TradeResult> execution_history_;
  std::vector<domain::TradeResult> submissions_;
  std::deque<FailedTrade> failed_trades_;
};

}  // namespace tradegate
