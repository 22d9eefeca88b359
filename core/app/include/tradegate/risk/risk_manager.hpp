#pragma once

#include "tradegate/domain/account_info.hpp"
#include "tradegate/domain/order.hpp"
#include "tradegate/domain/position.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tradegate {

// Aggregate outcome of RiskManager::validateOrder.
struct RiskVerdict {
  bool approved{false};
  std::string reason;
  domain::RiskLevel level{domain::RiskLevel::Low};
};

// One evaluation with level above LOW, appended by validateOrder.
struct RiskEvent {
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  std::int64_t quantity{0};
  std::string message;
  domain::RiskLevel level{domain::RiskLevel::Low};
  std::int64_t timestamp_ms{0};
};

// One executed fill, appended by recordTrade.
struct TradeRecord {
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Stateful pre-trade gatekeeper holding the configured limits and the
//         live per-day counters (daily P&L, daily trades, circuit breaker).
//
// @details
// Per-day state machine:
//
//   ACTIVE  --(daily_pnl < -max_daily_loss)-->  HALTED
//   HALTED  --(day rollover | resetCircuitBreaker())-->  ACTIVE
//
// While HALTED every order is rejected with CRITICAL before any other check
// runs. Day rollover is lazy: validateOrder, recordTrade and updatePnl first
// compare the current UTC trading day (from the injected ITimeProvider) to
// the day of the last reset and, if it moved, zero daily_pnl and
// daily_trades and clear the breaker. Running it twice for the same day is
// a no-op.
//
// validateOrder runs five independent checks:
//   1. position size   quantity × estimated price vs max_position_size
//   2. cash reserve    BUY only; cash left after the order vs min_cash_reserve
//   3. daily loss      daily_pnl vs -max_daily_loss (trips the breaker)
//   4. frequency       daily_trades vs max_daily_trades
//   5. concentration   projected position value / total_assets
// Any failing check rejects the order. The reported level is the maximum
// across all five and the reason joins every failing message with "; ".
// Every evaluation above LOW, passing or failing, is appended to the risk
// event log.
//
// A limit <= 0 disables its check (passes at LOW).
//
// Thread model:
//   All session state sits behind one std::mutex. Each public call holds it
//   for its whole read-modify-write, so concurrent validate/record/update
//   calls are serialized. No broker I/O ever happens under the lock.
//
// Ownership:
//   Holds a const reference to the time provider, which must outlive it.
//   Callers never touch the counters directly; all mutation goes through
//   recordTrade, updatePnl and resetCircuitBreaker.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // Estimated share price used when an order carries no price and the
  // symbol has no position to derive one from.
  static constexpr double kFallbackPrice = 100.0;

  RiskManager(const domain::RiskLimits& limits, const ITimeProvider& clock);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // -------------------------------------------------------------------------
  // validateOrder(order, account, positions)
  // -------------------------------------------------------------------------
  //
  // @brief  Evaluates `order` against every enabled check.
  //
  // @param  order      Candidate order. Its price (if any) drives the value
  //                    estimates.
  // @param  account    Fresh account snapshot. cash feeds the reserve check,
  //                    total_assets is the concentration denominator.
  // @param  positions  Fresh broker positions, used to project the
  //                    post-trade position for concentration.
  //
  // @return RiskVerdict. approved is false if any check failed or the
  //         breaker is active.
  //
  // Side-effects: may roll the trading day, may trip the circuit breaker,
  //               appends to the risk event log.
  // -------------------------------------------------------------------------
  RiskVerdict validateOrder(const domain::Order& order,
                            const domain::AccountInfo& account,
                            const std::vector<domain::Position>& positions);

  // -------------------------------------------------------------------------
  // recordTrade(order, executed_qty, execution_price)
  // -------------------------------------------------------------------------
  //
  // @brief  Counts one executed trade and appends it to the trade history.
  //
  // @details
  // Call only after a fill, with the quantity actually executed. An
  // executed_qty <= 0 is ignored.
  // -------------------------------------------------------------------------
  void recordTrade(const domain::Order& order, std::int64_t executed_qty,
                   double execution_price);

  // Adds `delta` to daily_pnl; trips the breaker if the result is below
  // -max_daily_loss.
  void updatePnl(double delta);

  // Manual override. Clears the breaker without touching the counters.
  void resetCircuitBreaker();

  bool isCircuitBreakerActive() const;
  std::int64_t dailyTrades() const;
  double dailyPnl() const;
  const domain::RiskLimits& limits() const { return limits_; }

  std::vector<RiskEvent> riskEvents() const;
  std::vector<TradeRecord> tradeHistory() const;

  // Named limit table with current utilization values.
  std::vector<domain::RiskLimit> limitTable() const;

  // -------------------------------------------------------------------------
  // riskSummary()
  // -------------------------------------------------------------------------
  // @brief  JSON snapshot of the session's risk state.
  //
  // @details
  // Keys: circuit_breaker_active, emergency_stop, circuit_breakers (one
  // daily_loss entry while the breaker is active), current_session
  // {trades_count, total_volume, pnl, start_time}, daily_pnl, daily_trades,
  // limits, limit_utilization, recent_risk_events (last 10), last_reset.
  // -------------------------------------------------------------------------
  nlohmann::json riskSummary() const;

 private:
  struct CheckOutcome {
    bool ok{true};
    domain::RiskLevel level{domain::RiskLevel::Low};
    std::string message;
  };

  // Requires mutex_ held.
  void rolloverIfNewDay();
  void tripBreaker(const char* source);

  CheckOutcome checkPositionSize(const domain::Order& order,
                                 const std::vector<domain::Position>& positions);
  CheckOutcome checkCashReserve(const domain::Order& order,
                                const domain::AccountInfo& account) const;
  CheckOutcome checkDailyLoss();
  CheckOutcome checkTradingFrequency() const;
  CheckOutcome checkConcentration(
      const domain::Order& order, const domain::AccountInfo& account,
      const std::vector<domain::Position>& positions) const;

  static double estimatePrice(const domain::Order& order,
                              const domain::Position* position);
  static const domain::Position* findPosition(
      const std::vector<domain::Position>& positions,
      const std::string& symbol);

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;

  double daily_pnl_{0.0};
  std::int64_t daily_trades_{0};
  bool circuit_breaker_active_{false};
  std::int64_t last_reset_day_;
  double last_position_value_{0.0};

  // Append-only for the life of the session; rollover does not clear them.
  std::vector<TradeRecord> trade_history_;
  std::vector<RiskEvent> risk_events_;
};

}  // namespace tradegate
