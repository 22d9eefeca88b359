#pragma once

#include "tradegate/broker/i_broker.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/domain/trading_decision.hpp"
#include "tradegate/execution/trade_executor.hpp"
#include "tradegate/portfolio/portfolio.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tradegate {

// Per-ticker outcome of one decision batch.
//   status: "executed" | "failed" | "error" | "skipped"
struct TickerOutcome {
  std::string ticker;
  std::string action;
  std::int64_t requested{0};
  std::int64_t executed{0};
  double price{0.0};
  std::string status;
  std::string reason;
};

struct BatchReport {
  std::vector<TickerOutcome> outcomes;
  std::int64_t successful_trades{0};
  double total_executed_value{0.0};
  bool circuit_breaker_active{false};

  nlohmann::json toJson() const;
};

// -----------------------------------------------------------------------------
// TradingSession
// -----------------------------------------------------------------------------
//
// @brief  Owns one trading session: broker, risk manager, trade executor and
//         local portfolio, with a start/stop lifecycle.
//
// @details
// Lifecycle:
//   start()  1. connect the broker (false → session stays stopped)
//            2. sync_portfolio: hydrate the Portfolio from broker positions
//               and cash, then log any reconcile() discrepancies
//            3. log validateTradingSession() readiness
//   stop()   disconnect the broker.
// Both are idempotent. The destructor calls stop().
//
// runBatch() processes tickers one at a time in map (alphabetical) order:
//   hold / quantity <= 0        → "skipped", broker not contacted
//   getMarketPrice fails        → "error" with the DataError message
//   execute() returns > 0       → "executed", value = qty × price
//   execute() returns 0         → "failed" with the executor's last failure
// One ticker's failure never stops the batch. The report carries the
// circuit-breaker state read after the last ticker.
//
// Thread model:
//   Driven from one thread (main). Components are internally synchronized.
//
// Ownership:
//   TradingSession
//    ├── clock_      (ITimeProvider& - non-owning, must outlive the session)
//    ├── broker_     (unique_ptr<IBroker>)
//    ├── risk_       (unique_ptr<RiskManager>)
//    ├── executor_   (unique_ptr<TradeExecutor> - borrows broker_ and risk_)
//    └── portfolio_  (unique_ptr<Portfolio>)
//   Members are destroyed in reverse order, so the executor goes before the
//   broker and risk manager it references.
// -----------------------------------------------------------------------------
class TradingSession {
 public:
  // `broker` null → makeBroker(config, clock).
  TradingSession(const TradeConfig& config, const domain::RiskLimits& limits,
                 const ITimeProvider& clock,
                 std::unique_ptr<IBroker> broker = nullptr);

  ~TradingSession();

  TradingSession(const TradingSession&) = delete;
  TradingSession& operator=(const TradingSession&) = delete;
  TradingSession(TradingSession&&) = delete;
  TradingSession& operator=(TradingSession&&) = delete;

  bool start();
  void stop();
  bool isRunning() const { return running_; }

  BatchReport runBatch(const domain::DecisionBatch& batch);

  // Portfolio vs broker positions, as of now.
  std::vector<PositionDiscrepancy> reconcile();

  // {mode, broker, running, risk, execution, portfolio}
  nlohmann::json statusReport() const;

  IBroker& broker() { return *broker_; }
  RiskManager& riskManager() { return *risk_; }
  TradeExecutor& executor() { return *executor_; }
  Portfolio& portfolio() { return *portfolio_; }
  const TradeConfig& config() const { return config_; }

 private:
  void syncPortfolio();

  const TradeConfig config_;
  const ITimeProvider& clock_;

  std::unique_ptr<IBroker> broker_;
  std::unique_ptr<RiskManager> risk_;
  std::unique_ptr<TradeExecutor> executor_;
  std::unique_ptr<Portfolio> portfolio_;

  bool running_{false};
};

}  // namespace tradegate
