#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tradegate {

namespace {

using domain::RiskLevel;

std::string money(double value) {
  std::ostringstream os;
  os << '$' << std::fixed << std::setprecision(2) << value;
  return os.str();
}

std::string percent(double ratio) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << ratio * 100.0 << '%';
  return os.str();
}

nlohmann::json toJson(const RiskEvent& e) {
  return {
      {"timestamp", format_iso8601(e.timestamp_ms)},
      {"symbol", e.symbol},
      {"side", domain::sideToString(e.side)},
      {"quantity", e.quantity},
      {"message", e.message},
      {"risk_level", domain::riskLevelToString(e.level)},
  };
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskManager::RiskManager(const domain::RiskLimits& limits,
                         const ITimeProvider& clock)
    : limits_(limits),
      clock_(clock),
      last_reset_day_(trading_day(clock.now_ms())) {
  std::cout << "[RiskManager] initialized. max_position_size="
            << limits_.max_position_size
            << " max_daily_loss=" << limits_.max_daily_loss
            << " max_daily_trades=" << limits_.max_daily_trades
            << " max_concentration=" << percent(limits_.max_position_concentration)
            << " min_cash_reserve=" << limits_.min_cash_reserve << "\n";
}

// -----------------------------------------------------------------------------
// validateOrder: breaker gate, then the five checks
// -----------------------------------------------------------------------------
RiskVerdict RiskManager::validateOrder(
    const domain::Order& order, const domain::AccountInfo& account,
    const std::vector<domain::Position>& positions) {
  std::lock_guard lock(mutex_);
  rolloverIfNewDay();

  const std::int64_t now = clock_.now_ms();

  if (circuit_breaker_active_) {
    const std::string reason = "Circuit breaker active - trading halted";
    risk_events_.push_back(RiskEvent{order.symbol(), order.side(),
                                     order.quantity(), reason,
                                     RiskLevel::Critical, now});
    std::cerr << "[RiskManager] HALTED: rejecting "
              << domain::sideToString(order.side()) << " "
              << order.quantity() << " " << order.symbol() << "\n";
    return RiskVerdict{false, reason, RiskLevel::Critical};
  }

  const CheckOutcome checks[] = {
      checkPositionSize(order, positions),
      checkCashReserve(order, account),
      checkDailyLoss(),
      checkTradingFrequency(),
      checkConcentration(order, account, positions),
  };

  RiskLevel level = RiskLevel::Low;
  std::string reason;

  for (const auto& check : checks) {
    level = domain::maxLevel(level, check.level);

    if (check.level != RiskLevel::Low) {
      risk_events_.push_back(RiskEvent{order.symbol(), order.side(),
                                       order.quantity(), check.message,
                                       check.level, now});
      if (check.level == RiskLevel::Critical) {
        std::cerr << "[RiskManager] CRITICAL: " << check.message << "\n";
      } else if (check.level == RiskLevel::High) {
        std::cerr << "[RiskManager] WARNING: " << check.message << "\n";
      }
    }

    if (!check.ok) {
      if (!reason.empty()) {
        reason += "; ";
      }
      reason += check.message;
    }
  }

  if (!reason.empty()) {
    std::cerr << "[RiskManager] Order rejected ("
              << domain::riskLevelToString(level) << "): " << reason << "\n";
    return RiskVerdict{false, reason, level};
  }

  if (level != RiskLevel::Low) {
    std::cout << "[RiskManager] Order approved with "
              << domain::riskLevelToString(level) << " risk level\n";
  }
  return RiskVerdict{true, "All risk checks passed", level};
}

// -----------------------------------------------------------------------------
// recordTrade / updatePnl / resetCircuitBreaker
// -----------------------------------------------------------------------------
void RiskManager::recordTrade(const domain::Order& order,
                              std::int64_t executed_qty,
                              double execution_price) {
  if (executed_qty <= 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  rolloverIfNewDay();

  ++daily_trades_;
  trade_history_.push_back(TradeRecord{order.symbol(), order.side(),
                                       executed_qty, execution_price,
                                       clock_.now_ms()});
}

void RiskManager::updatePnl(double delta) {
  std::lock_guard lock(mutex_);
  rolloverIfNewDay();

  daily_pnl_ += delta;
  if (limits_.max_daily_loss > 0.0 && daily_pnl_ < -limits_.max_daily_loss) {
    tripBreaker("updatePnl");
  }
}

void RiskManager::resetCircuitBreaker() {
  std::lock_guard lock(mutex_);
  std::cerr << "[RiskManager] WARNING: circuit breaker manually reset "
               "(daily_pnl="
            << money(daily_pnl_) << ")\n";
  circuit_breaker_active_ = false;
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
bool RiskManager::isCircuitBreakerActive() const {
  std::lock_guard lock(mutex_);
  return circuit_breaker_active_;
}

std::int64_t RiskManager::dailyTrades() const {
  std::lock_guard lock(mutex_);
  return daily_trades_;
}

double RiskManager::dailyPnl() const {
  std::lock_guard lock(mutex_);
  return daily_pnl_;
}

std::vector<RiskEvent> RiskManager::riskEvents() const {
  std::lock_guard lock(mutex_);
  return risk_events_;
}

std::vector<TradeRecord> RiskManager::tradeHistory() const {
  std::lock_guard lock(mutex_);
  return trade_history_;
}

std::vector<domain::RiskLimit> RiskManager::limitTable() const {
  std::lock_guard lock(mutex_);
  return {
      domain::RiskLimit{"max_position_size", limits_.max_position_size,
                        last_position_value_},
      domain::RiskLimit{"max_daily_loss", limits_.max_daily_loss,
                        std::max(0.0, -daily_pnl_)},
      domain::RiskLimit{"max_daily_trades",
                        static_cast<double>(limits_.max_daily_trades),
                        static_cast<double>(daily_trades_), 0.9},
      domain::RiskLimit{"min_cash_reserve", limits_.min_cash_reserve},
      domain::RiskLimit{"max_position_concentration",
                        limits_.max_position_concentration},
  };
}

nlohmann::json RiskManager::riskSummary() const {
  auto table = limitTable();

  std::lock_guard lock(mutex_);

  double total_volume = 0.0;
  for (const auto& t : trade_history_) {
    total_volume += static_cast<double>(t.quantity) * t.price;
  }

  nlohmann::json breakers = nlohmann::json::array();
  if (circuit_breaker_active_) {
    breakers.push_back({
        {"type", "daily_loss"},
        {"active", true},
        {"threshold", limits_.max_daily_loss},
        {"current_value", daily_pnl_ < 0.0 ? -daily_pnl_ : 0.0},
    });
  }

  nlohmann::json utilization = nlohmann::json::object();
  for (const auto& limit : table) {
    auto check = limit.check();
    utilization[limit.name] = {
        {"max_value", limit.max_value},
        {"current_value", limit.current_value},
        {"utilization", check.utilization},
        {"risk_level", domain::riskLevelToString(check.level)},
    };
  }

  nlohmann::json recent = nlohmann::json::array();
  const std::size_t first =
      risk_events_.size() > 10 ? risk_events_.size() - 10 : 0;
  for (std::size_t i = first; i < risk_events_.size(); ++i) {
    recent.push_back(toJson(risk_events_[i]));
  }

  nlohmann::json j;
  j["circuit_breaker_active"] = circuit_breaker_active_;
  j["emergency_stop"] = circuit_breaker_active_;
  j["circuit_breakers"] = breakers;
  j["current_session"] = {
      {"trades_count", daily_trades_},
      {"total_volume", total_volume},
      {"pnl", daily_pnl_},
      {"start_time", format_date(last_reset_day_)},
  };
  j["daily_pnl"] = daily_pnl_;
  j["daily_trades"] = daily_trades_;
  j["limits"] = toJson(limits_);
  j["limit_utilization"] = utilization;
  j["recent_risk_events"] = recent;
  j["last_reset"] = format_date(last_reset_day_);
  return j;
}

// -----------------------------------------------------------------------------
// rolloverIfNewDay: lazy daily reset (caller holds mutex_)
// -----------------------------------------------------------------------------
void RiskManager::rolloverIfNewDay() {
  const std::int64_t today = trading_day(clock_.now_ms());
  if (today == last_reset_day_) {
    return;
  }

  std::cout << "[RiskManager] New trading day " << format_date(today)
            << ": resetting daily counters (previous P&L "
            << money(daily_pnl_) << ", trades " << daily_trades_ << ")\n";
  daily_pnl_ = 0.0;
  daily_trades_ = 0;
  circuit_breaker_active_ = false;
  last_reset_day_ = today;
}

void RiskManager::tripBreaker(const char* source) {
  if (!circuit_breaker_active_) {
    std::cerr << "[RiskManager] CRITICAL: circuit breaker activated by "
              << source << ". Daily loss " << money(-daily_pnl_)
              << " exceeds " << money(limits_.max_daily_loss)
              << ". ALL TRADING HALTED.\n";
  }
  circuit_breaker_active_ = true;
}

// -----------------------------------------------------------------------------
// Individual checks (caller holds mutex_)
// -----------------------------------------------------------------------------
RiskManager::CheckOutcome RiskManager::checkPositionSize(
    const domain::Order& order,
    const std::vector<domain::Position>& positions) {
  const double price =
      estimatePrice(order, findPosition(positions, order.symbol()));
  const double value = static_cast<double>(order.quantity()) * price;
  last_position_value_ = value;

  domain::RiskLimit limit{"Position size", limits_.max_position_size};
  auto check = limit.check(value);

  CheckOutcome out{check.ok, check.level, ""};
  if (!check.ok) {
    out.message = "Position size " + money(value) + " exceeds limit " +
                  money(limits_.max_position_size);
  } else if (check.level != RiskLevel::Low) {
    out.message = "Position size approaching limit: " + money(value) +
                  " is " + percent(check.utilization) + " of " +
                  money(limits_.max_position_size);
  } else {
    out.message = "Position size OK";
  }
  return out;
}

RiskManager::CheckOutcome RiskManager::checkCashReserve(
    const domain::Order& order, const domain::AccountInfo& account) const {
  if (order.side() == domain::Side::Sell) {
    return {true, RiskLevel::Low, "Sell order - increases cash"};
  }
  const double reserve = limits_.min_cash_reserve;
  if (reserve <= 0.0) {
    return {true, RiskLevel::Low, "Cash reserve check disabled"};
  }

  const double required = order.notional();
  const double remaining = account.cash - required;

  if (remaining < reserve) {
    return {false, RiskLevel::Critical,
            "Insufficient cash reserve: " + money(remaining) + " < " +
                money(reserve)};
  }
  if (remaining < reserve * 1.5) {
    return {true, RiskLevel::Medium,
            "Cash reserve low: " + money(remaining) + " remaining"};
  }
  return {true, RiskLevel::Low, "Cash reserve OK"};
}

RiskManager::CheckOutcome RiskManager::checkDailyLoss() {
  const double max_loss = limits_.max_daily_loss;
  if (max_loss <= 0.0) {
    return {true, RiskLevel::Low, "Daily loss check disabled"};
  }

  if (daily_pnl_ < -max_loss) {
    tripBreaker("validateOrder");
    return {false, RiskLevel::Critical,
            "Daily loss limit exceeded: " + money(std::abs(daily_pnl_))};
  }
  if (daily_pnl_ < -max_loss * 0.8) {
    return {true, RiskLevel::High,
            "Approaching daily loss limit: " + money(std::abs(daily_pnl_)) +
                " of " + money(max_loss)};
  }
  return {true, RiskLevel::Low, "Daily P&L within limits"};
}

RiskManager::CheckOutcome RiskManager::checkTradingFrequency() const {
  const long max_trades = limits_.max_daily_trades;
  if (max_trades <= 0) {
    return {true, RiskLevel::Low, "Trading frequency check disabled"};
  }

  if (daily_trades_ >= max_trades) {
    return {false, RiskLevel::Critical,
            "Daily trade limit reached: " + std::to_string(daily_trades_) +
                "/" + std::to_string(max_trades)};
  }
  if (static_cast<double>(daily_trades_) >= max_trades * 0.9) {
    return {true, RiskLevel::Medium,
            "Approaching daily trade limit: " + std::to_string(daily_trades_) +
                "/" + std::to_string(max_trades)};
  }
  return {true, RiskLevel::Low, "Trading frequency OK"};
}

RiskManager::CheckOutcome RiskManager::checkConcentration(
    const domain::Order& order, const domain::AccountInfo& account,
    const std::vector<domain::Position>& positions) const {
  const double portfolio_value = account.total_assets;
  const double limit = limits_.max_position_concentration;
  if (portfolio_value <= 0.0) {
    return {true, RiskLevel::Low, "No portfolio value to check"};
  }
  if (limit <= 0.0) {
    return {true, RiskLevel::Low, "Concentration check disabled"};
  }

  const domain::Position* current = findPosition(positions, order.symbol());
  const std::int64_t current_qty = current ? current->quantity : 0;
  const std::int64_t new_qty = order.side() == domain::Side::Buy
                                   ? current_qty + order.quantity()
                                   : current_qty - order.quantity();

  const double new_value =
      std::abs(static_cast<double>(new_qty) * estimatePrice(order, current));
  const double concentration = new_value / portfolio_value;

  if (concentration > limit) {
    return {false, RiskLevel::High,
            "Position concentration " + percent(concentration) +
                " exceeds limit " + percent(limit)};
  }
  if (concentration > limit * 0.8) {
    return {true, RiskLevel::Medium,
            "Position concentration approaching limit: " +
                percent(concentration) + " of " + percent(limit)};
  }
  return {true, RiskLevel::Low, "Position concentration OK"};
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
double RiskManager::estimatePrice(const domain::Order& order,
                                  const domain::Position* position) {
  if (order.price() && *order.price() > 0.0) {
    return *order.price();
  }
  if (position != nullptr && position->quantity != 0) {
    if (position->market_price > 0.0) {
      return position->market_price;
    }
    return std::abs(position->market_value) /
           static_cast<double>(std::max<std::int64_t>(
               std::abs(position->quantity), 1));
  }
  return kFallbackPrice;
}

const domain::Position* RiskManager::findPosition(
    const std::vector<domain::Position>& positions,
    const std::string& symbol) {
  auto it = std::find_if(
      positions.begin(), positions.end(),
      [&symbol](const domain::Position& p) { return p.symbol == symbol; });
  return it != positions.end() ? &*it : nullptr;
}

}  // namespace tradegate
