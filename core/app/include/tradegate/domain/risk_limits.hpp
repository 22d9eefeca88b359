#pragma once

#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLevel - four-tier severity, ordered LOW < MEDIUM < HIGH < CRITICAL
// -----------------------------------------------------------------------------
enum class RiskLevel {
  Low = 0,
  Medium = 1,
  High = 2,
  Critical = 3,
};

inline const char* riskLevelToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:      return "LOW";
    case RiskLevel::Medium:   return "MEDIUM";
    case RiskLevel::High:     return "HIGH";
    case RiskLevel::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

inline RiskLevel maxLevel(RiskLevel a, RiskLevel b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

// -----------------------------------------------------------------------------
// RiskLimit - a named ceiling with current utilization
// -----------------------------------------------------------------------------
//
// @brief  One entry of the risk manager's limit table.
//
// @details
// check(additional) evaluates (current_value + additional) / max_value:
//   utilization >= 1.0               → not ok, CRITICAL
//   utilization >= warning_threshold → ok, HIGH
//   utilization >= 0.5               → ok, MEDIUM
//   otherwise                        → ok, LOW
// A disabled limit, or one with max_value <= 0, always passes at LOW.
//
// current_value is maintained by RiskManager for the counters it backs
// (daily trades, daily loss, last evaluated position value) and is reset at
// day rollover for the daily counters.
// -----------------------------------------------------------------------------
struct RiskLimit {
  struct Check {
    bool ok{true};
    RiskLevel level{RiskLevel::Low};
    double utilization{0.0};
    std::string message;
  };

  std::string name;
  double max_value{0.0};
  double current_value{0.0};
  double warning_threshold{0.8};
  bool enabled{true};

  bool active() const { return enabled && max_value > 0.0; }

  Check check(double additional = 0.0) const;
};

// -----------------------------------------------------------------------------
// RiskLimits - configured thresholds for one trading session
// -----------------------------------------------------------------------------
//
// Monetary limits are in account currency. Ratios are fractions (0.20 = 20%).
// A value <= 0 disables the corresponding check.
//
// max_sector_concentration, max_leverage and max_drawdown are carried and
// reported in the risk summary but not evaluated by validateOrder: the
// broker snapshot carries no sector, leverage or equity-curve data.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_position_size{100000.0};
  double max_portfolio_value{1000000.0};
  double max_daily_loss{10000.0};
  double max_position_concentration{0.20};
  double max_sector_concentration{0.30};
  long max_daily_trades{100};
  double min_cash_reserve{10000.0};
  double max_leverage{1.0};
  double max_drawdown{0.10};
};

}  // namespace domain
}  // namespace tradegate
