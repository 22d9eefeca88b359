#include "tradegate/engine/trading_session.hpp"
#include "tradegate/broker/broker_factory.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace tradegate {

nlohmann::json BatchReport::toJson() const {
  nlohmann::json results = nlohmann::json::object();
  for (const auto& o : outcomes) {
    nlohmann::json r = {{"status", o.status}, {"action", o.action}};
    if (o.status == "executed") {
      r["quantity"] = o.executed;
      r["price"] = o.price;
      r["value"] = static_cast<double>(o.executed) * o.price;
    } else {
      r["requested"] = o.requested;
      r["reason"] = o.reason;
    }
    results[o.ticker] = r;
  }
  return {
      {"execution_results", results},
      {"execution_summary",
       {{"successful_trades", successful_trades},
        {"total_tickers", outcomes.size()},
        {"total_value", total_executed_value}}},
      {"circuit_breaker_active", circuit_breaker_active},
  };
}

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
TradingSession::TradingSession(const TradeConfig& config,
                               const domain::RiskLimits& limits,
                               const ITimeProvider& clock,
                               std::unique_ptr<IBroker> broker)
    : config_(config), clock_(clock), broker_(std::move(broker)) {
  validateTradeConfig(config_);
  if (!broker_) {
    broker_ = makeBroker(config_, clock_);
  }
  risk_ = std::make_unique<RiskManager>(limits, clock_);
  executor_ =
      std::make_unique<TradeExecutor>(*broker_, *risk_, config_, clock_);
  portfolio_ = std::make_unique<Portfolio>(config_.paper_starting_cash,
                                           config_.margin_requirement);
}

TradingSession::~TradingSession() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
bool TradingSession::start() {
  if (running_) {
    return true;
  }

  if (!executor_->connect()) {
    std::cerr << "[TradingSession] Connection to " << broker_->name()
              << " failed.\n";
    return false;
  }

  if (config_.sync_portfolio) {
    syncPortfolio();
  }

  const SessionReadiness ready = executor_->validateTradingSession();
  std::cout << "[TradingSession] " << (config_.dry_run ? "[DRY RUN] " : "")
            << "started on " << broker_->name() << ": " << ready.message
            << "\n";

  running_ = true;
  return true;
}

void TradingSession::stop() {
  if (!running_) {
    return;
  }
  executor_->disconnect();
  running_ = false;
  std::cout << "[TradingSession] stopped.\n";
}

void TradingSession::syncPortfolio() {
  auto positions = broker_->getPositions();
  if (!positions.ok()) {
    std::cerr << "[TradingSession] WARNING: portfolio not synced: "
              << positions.error().message << "\n";
    return;
  }

  std::optional<double> cash;
  auto account = broker_->getAccountInfo();
  if (account.ok()) {
    cash = account.value().cash;
  } else {
    std::cerr << "[TradingSession] WARNING: keeping local cash: "
              << account.error().message << "\n";
  }

  portfolio_->hydrate(positions.value(), cash);
  std::cout << "[TradingSession] Portfolio synced: "
            << positions.value().size() << " position(s).\n";

  for (const auto& d : portfolio_->reconcile(positions.value())) {
    std::cerr << "[TradingSession] WARNING: " << d.symbol << " local "
              << d.local_qty << " vs broker " << d.broker_qty << "\n";
  }
}

std::vector<PositionDiscrepancy> TradingSession::reconcile() {
  auto positions = broker_->getPositions();
  if (!positions.ok()) {
    std::cerr << "[TradingSession] reconcile: " << positions.error().message
              << "\n";
    return {};
  }
  return portfolio_->reconcile(positions.value());
}

// -----------------------------------------------------------------------------
// runBatch(): one ticker at a time, deterministic order
// -----------------------------------------------------------------------------
BatchReport TradingSession::runBatch(const domain::DecisionBatch& batch) {
  BatchReport report;

  for (const auto& [ticker, decision] : batch) {
    TickerOutcome outcome;
    outcome.ticker = ticker;
    outcome.action = domain::tradeActionToString(decision.action);
    outcome.requested = decision.quantity;

    if (decision.action == domain::TradeAction::Hold ||
        decision.quantity <= 0) {
      outcome.status = "skipped";
      outcome.reason = "hold";
      report.outcomes.push_back(outcome);
      continue;
    }

    auto price = broker_->getMarketPrice(ticker);
    if (!price.ok()) {
      outcome.status = "error";
      outcome.reason = std::string(errorKindToString(price.error().kind)) +
                       ": " + price.error().message;
      std::cerr << "[TradingSession] " << ticker << ": " << outcome.reason
                << "\n";
      report.outcomes.push_back(outcome);
      continue;
    }
    outcome.price = price.value();

    outcome.executed = executor_->execute(ticker, outcome.action,
                                          decision.quantity, outcome.price,
                                          *portfolio_);
    if (outcome.executed > 0) {
      outcome.status = "executed";
      ++report.successful_trades;
      report.total_executed_value +=
          static_cast<double>(outcome.executed) * outcome.price;
    } else {
      outcome.status = "failed";
      auto failures = executor_->recentFailures(1);
      outcome.reason = failures.empty() || failures.back().ticker != ticker
                           ? "Execution failed"
                           : failures.back().error;
    }
    report.outcomes.push_back(outcome);
  }

  report.circuit_breaker_active = risk_->isCircuitBreakerActive();

  std::cout << "[TradingSession] Batch done: " << report.successful_trades
            << "/" << report.outcomes.size() << " executed, value "
            << report.total_executed_value << ", circuit breaker "
            << (report.circuit_breaker_active ? "ACTIVE" : "inactive")
            << "\n";
  return report;
}

nlohmann::json TradingSession::statusReport() const {
  return {
      {"mode", config_.dry_run ? "dry_run" : "live"},
      {"broker", broker_->name()},
      {"running", running_},
      {"risk", risk_->riskSummary()},
      {"execution", executor_->executionReport()},
      {"portfolio", portfolio_->toJson()},
  };
}

}  // namespace tradegate
