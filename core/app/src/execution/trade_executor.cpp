#include "tradegate/execution/trade_executor.hpp"
#include "tradegate/domain/json_codec.hpp"
#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tradegate {

namespace {

std::string money(double value) {
  std::ostringstream os;
  os << '$' << std::fixed << std::setprecision(2) << value;
  return os.str();
}

std::string describe(const Error& e) {
  return std::string(errorKindToString(e.kind)) + ": " + e.message;
}

nlohmann::json toJson(const FailedTrade& f) {
  return {
      {"timestamp", format_iso8601(f.timestamp_ms)},
      {"ticker", f.ticker},
      {"action", f.action},
      {"requested_qty", f.requested_qty},
      {"executed_qty", f.executed_qty},
      {"price", f.price},
      {"error", f.error},
  };
}

}  // namespace

TradeExecutor::TradeExecutor(IBroker& broker, RiskManager& risk,
                             const TradeConfig& config,
                             const ITimeProvider& clock)
    : broker_(broker), risk_(risk), config_(config), clock_(clock) {
  validateTradeConfig(config_);
}

bool TradeExecutor::connect() { return broker_.connect(); }

bool TradeExecutor::disconnect() { return broker_.disconnect(); }

// -----------------------------------------------------------------------------
// execute: translate → validate → submit → book
// -----------------------------------------------------------------------------
std::int64_t TradeExecutor::execute(const std::string& ticker,
                                    const std::string& action,
                                    std::int64_t quantity,
                                    double current_price,
                                    Portfolio& portfolio) {
  const std::optional<double> price =
      current_price > 0.0 ? std::optional<double>(current_price) : std::nullopt;

  std::optional<domain::Order> order;
  try {
    order = translator_.translate(ticker, action, quantity, price);
  } catch (const std::exception& e) {
    std::cerr << "[TradeExecutor] Cannot build order for " << ticker << ": "
              << e.what() << "\n";
    recordFailure(ticker, action, quantity, 0, current_price, e.what());
    return 0;
  }
  if (!order) {
    return 0;
  }

  {
    std::lock_guard lock(stats_mutex_);
    ++total_trades_;
  }

  if (config_.log_trades) {
    std::cout << "[TradeExecutor] " << (config_.dry_run ? "[DRY RUN] " : "")
              << "Executing " << action << " " << quantity << " " << ticker
              << " @ " << current_price << "\n";
  }

  try {
    // No usable price from the caller: quote the broker so funds, order
    // value and risk checks all see the real notional.
    double price = current_price;
    if (price <= 0.0 && broker_.isConnected()) {
      auto quote = broker_.getMarketPrice(ticker);
      if (!quote.ok() || quote.value() <= 0.0) {
        const std::string reason =
            "DataError: no market price for " + ticker +
            (quote.ok() ? std::string(" (non-positive quote)")
                        : " (" + describe(quote.error()) + ")");
        std::cerr << "[TradeExecutor] Rejected " << action << " " << quantity
                  << " " << ticker << ": " << reason << "\n";
        recordFailure(ticker, action, quantity, 0, current_price, reason);
        return 0;
      }
      price = quote.value();
      order = translator_.translate(ticker, action, quantity, price);
    }

    if (auto rejection = preTradeCheck(*order, price)) {
      std::cerr << "[TradeExecutor] Rejected " << action << " " << quantity
                << " " << ticker << ": " << *rejection << "\n";
      recordFailure(ticker, action, quantity, 0, price, *rejection);
      return 0;
    }

    domain::TradeResult result = broker_.submitOrder(*order);
    {
      std::lock_guard lock(stats_mutex_);
      submissions_.push_back(result);
    }

    if (!result.hasFill()) {
      const std::string error = result.error_msg.value_or(
          std::string("order ") + domain::orderStatusToString(result.status) +
          " with no fill");
      std::cerr << "[TradeExecutor] No fill for " << ticker << ": " << error
                << "\n";
      recordFailure(ticker, action, quantity, 0, price, error);
      return 0;
    }

    const std::int64_t filled = result.filled_quantity;
    const double fill_price = result.avg_price.value_or(price);
    const auto parsed = domain::parseTradeAction(action);

    FillEffect effect =
        portfolio.applyFill(*parsed, ticker, filled, fill_price);
    portfolio.chargeCommission(result.commission);

    risk_.recordTrade(*order, filled, fill_price);
    risk_.updatePnl(effect.realized_pnl - result.commission);

    {
      std::lock_guard lock(stats_mutex_);
      ++successful_trades_;
      execution_history_.push_back(result);
    }

    if (config_.log_trades) {
      std::cout << "[TradeExecutor] Executed " << filled << "/" << quantity
                << " " << ticker << " @ " << fill_price << " ("
                << domain::orderStatusToString(result.status)
                << ", commission " << money(result.commission) << ")\n";
    }
    return filled;

  } catch (const std::exception& e) {
    std::cerr << "[TradeExecutor] ERROR executing " << action << " "
              << ticker << ": " << e.what() << "\n";
    recordFailure(ticker, action, quantity, 0, current_price, e.what());
    return 0;
  }
}

// -----------------------------------------------------------------------------
// preTradeCheck: connectivity, snapshots, risk, funds, order value
// -----------------------------------------------------------------------------
std::optional<std::string> TradeExecutor::preTradeCheck(
    const domain::Order& order, double price) {
  if (!broker_.isConnected()) {
    return std::string("ConnectionError: not connected to broker");
  }

  auto account = broker_.getAccountInfo();
  if (!account.ok()) {
    return "Unable to get account info: " + describe(account.error());
  }
  auto positions = broker_.getPositions();
  if (!positions.ok()) {
    return "Unable to get positions: " + describe(positions.error());
  }

  RiskVerdict verdict =
      risk_.validateOrder(order, account.value(), positions.value());
  if (!verdict.approved) {
    return "Risk check failed (" +
           std::string(domain::riskLevelToString(verdict.level)) +
           "): " + verdict.reason;
  }

  const double value = static_cast<double>(order.quantity()) * price;

  if (order.side() == domain::Side::Buy) {
    if (value > account.value().buying_power) {
      return "Insufficient buying power: need " + money(value) + ", have " +
             money(account.value().buying_power);
    }
  } else if (!config_.enable_short_selling) {
    std::int64_t held = 0;
    for (const auto& p : positions.value()) {
      if (p.symbol == order.symbol()) {
        held += p.quantity;
      }
    }
    if (held < order.quantity()) {
      return "Insufficient shares: have " + std::to_string(held) +
             ", need " + std::to_string(order.quantity()) +
             " (short selling disabled)";
    }
  }

  if (config_.max_order_value > 0.0 && value > config_.max_order_value) {
    return "Order value " + money(value) + " exceeds maximum " +
           money(config_.max_order_value);
  }

  return std::nullopt;
}

void TradeExecutor::recordFailure(const std::string& ticker,
                                  const std::string& action,
                                  std::int64_t requested,
                                  std::int64_t executed, double price,
                                  const std::string& error) {
  std::lock_guard lock(stats_mutex_);
  ++failed_count_;
  failed_trades_.push_back(FailedTrade{clock_.now_ms(), ticker, action,
                                       requested, executed, price, error});
  while (failed_trades_.size() > kMaxFailedTrades) {
    failed_trades_.pop_front();
  }
}

// -----------------------------------------------------------------------------
// Session readiness and reports
// -----------------------------------------------------------------------------
SessionReadiness TradeExecutor::validateTradingSession() {
  if (!broker_.isConnected()) {
    return {false, "Not connected to trading platform"};
  }
  auto account = broker_.getAccountInfo();
  if (!account.ok()) {
    return {false, "Unable to get account information: " +
                       describe(account.error())};
  }
  if (account.value().buying_power <= 0.0) {
    return {false, "No buying power available"};
  }
  return {true, "Trading session is ready"};
}

nlohmann::json TradeExecutor::executionReport() const {
  std::lock_guard lock(stats_mutex_);

  double executed_value = 0.0;
  double commission = 0.0;
  for (const auto& r : execution_history_) {
    if (r.avg_price && r.filled_quantity > 0) {
      executed_value += *r.avg_price * static_cast<double>(r.filled_quantity);
      commission += r.commission;
    }
  }

  nlohmann::json recent = nlohmann::json::array();
  const std::size_t first = failed_trades_.size() > kRecentFailures
                                ? failed_trades_.size() - kRecentFailures
                                : 0;
  for (std::size_t i = first; i < failed_trades_.size(); ++i) {
    recent.push_back(toJson(failed_trades_[i]));
  }

  return {
      {"total_trades", total_trades_},
      {"successful_trades", successful_trades_},
      {"failed_trades", failed_count_},
      {"success_rate", static_cast<double>(successful_trades_) /
                           static_cast<double>(
                               std::max<std::int64_t>(1, total_trades_))},
      {"total_executed_value", executed_value},
      {"total_commission", commission},
      {"recent_failures", recent},
  };
}

nlohmann::json TradeExecutor::tradeSummary() const {
  std::lock_guard lock(stats_mutex_);
  std::int64_t ok = 0;
  std::int64_t failed = 0;
  for (const auto& r : submissions_) {
    switch (r.status) {
      case domain::OrderStatus::Filled:
      case domain::OrderStatus::PartiallyFilled:
        ++ok;
        break;
      case domain::OrderStatus::Rejected:
      case domain::OrderStatus::Failed:
      case domain::OrderStatus::Cancelled:
        ++failed;
        break;
      default:
        break;
    }
  }
  const auto total = static_cast<std::int64_t>(submissions_.size());
  return {
      {"total_trades", total},
      {"successful_trades", ok},
      {"failed_trades", failed},
      {"success_rate", total > 0 ? static_cast<double>(ok) /
                                       static_cast<double>(total)
                                 : 0.0},
  };
}

nlohmann::json TradeExecutor::accountSummary() {
  nlohmann::json j;
  nlohmann::json errors = nlohmann::json::array();

  auto account = broker_.getAccountInfo();
  if (account.ok()) {
    j["account_info"] = domain::toJson(account.value());
  } else {
    j["account_info"] = nullptr;
    errors.push_back(describe(account.error()));
  }

  auto positions = broker_.getPositions();
  if (positions.ok()) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& p : positions.value()) {
      list.push_back(domain::toJson(p));
    }
    j["positions"] = list;
  } else {
    j["positions"] = nullptr;
    errors.push_back(describe(positions.error()));
  }

  j["trade_summary"] = tradeSummary();
  j["execution_stats"] = executionReport();
  j["errors"] = errors;
  return j;
}

std::vector<FailedTrade> TradeExecutor::recentFailures(std::size_t n) const {
  std::lock_guard lock(stats_mutex_);
  const std::size_t first =
      failed_trades_.size() > n ? failed_trades_.size() - n : 0;
  return std::vector<FailedTrade>(failed_trades_.begin() + first,
                                  failed_trades_.end());
}

std::vector<domain::TradeResult> TradeExecutor::executionHistory() const {
  std::lock_guard lock(stats_mutex_);
  return execution_history_;
}

std::int64_t TradeExecutor::totalTrades() const {
  std::lock_guard lock(stats_mutex_);
  return total_trades_;
}

std::int64_t TradeExecutor::successfulTrades() const {
  std::lock_guard lock(stats_mutex_);
  return successful_trades_;
}

}  // namespace tradegate
