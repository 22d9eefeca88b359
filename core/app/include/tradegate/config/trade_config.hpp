#pragma once

#include "tradegate/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tradegate {

// Thrown when a configuration value violates its documented range.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

// Accepts DEBUG, INFO, WARNING (or WARN), ERROR in any case.
std::optional<LogLevel> parseLogLevel(const std::string& text);
const char* logLevelToString(LogLevel level);

// -----------------------------------------------------------------------------
// TradeConfig - session-wide execution configuration
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct consumed by the brokers, the trade executor and
//         the validation harness.
//
// @details
// dry_run selects the execution path: true routes every submission to the
// SimulatedBroker, false sends it to the broker gateway. It is the only
// switch between simulated and real money.
//
// Every component that takes a TradeConfig calls validateTradeConfig() in
// its constructor, so an invalid config fails fast at session construction.
// -----------------------------------------------------------------------------
struct TradeConfig {
  // Broker gateway
  std::string broker_host{"127.0.0.1"};
  int broker_port{11111};
  std::optional<std::string> trading_account;
  std::optional<std::string> trading_pwd;
  int request_timeout_ms{5000};

  // Execution
  bool dry_run{true};
  std::int64_t max_position_size{10000};
  long max_daily_trades{100};
  double max_order_value{50000.0};
  bool enable_short_selling{false};
  bool sync_portfolio{true};

  // Dry-run fill model
  double paper_starting_cash{100000.0};
  double slippage{0.001};
  double commission_rate{0.001};
  double min_commission{1.0};

  // Portfolio mirror: fraction of short notional held as margin.
  double margin_requirement{0.5};

  // Logging
  std::string log_level{"INFO"};
  bool log_trades{true};

  // "tcp://<host>:<port>"
  std::string gatewayEndpoint() const;

  // -------------------------------------------------------------------------
  // fromEnvironment()
  // -------------------------------------------------------------------------
  // @brief  Builds a TradeConfig from environment variables, falling back to
  //         the member defaults for anything unset.
  //
  // @details
  // Reads BROKER_HOST, BROKER_PORT, BROKER_ACCOUNT_ID, BROKER_TRADING_PWD,
  // BROKER_TIMEOUT_MS, ENABLE_LIVE_TRADING (dry_run = !value),
  // MAX_POSITION_SIZE, MAX_DAILY_TRADES, MAX_ORDER_VALUE,
  // ENABLE_SHORT_SELLING, LOG_LEVEL.
  //
  // Booleans accept true/1/yes/on (case-insensitive). A numeric variable
  // that does not parse throws ConfigError naming the variable.
  // The result is validated before it is returned.
  // -------------------------------------------------------------------------
  static TradeConfig fromEnvironment();
};

// Throws ConfigError describing the first violated constraint.
void validateTradeConfig(const TradeConfig& config);

// Config as JSON with the trading password masked.
nlohmann::json toJson(const TradeConfig& config);

// -----------------------------------------------------------------------------
// loadRiskLimits
// -----------------------------------------------------------------------------
// @brief  Builds RiskLimits from a risk configuration object.
//
// @param  j         Object with any of: max_position_size,
//                   max_portfolio_value, max_daily_loss,
//                   max_position_concentration, max_sector_concentration,
//                   max_daily_trades (or max_trades_per_day), min_cash_reserve,
//                   max_leverage, max_drawdown.
// @param  fallback  When given, its max_position_size and max_daily_trades
//                   are used for keys missing from `j`.
//
// @details
// Unknown keys are ignored. Keys whose value is not a number are ignored
// with a warning. A null or non-object `j` yields the defaults.
// -----------------------------------------------------------------------------
domain::RiskLimits loadRiskLimits(const nlohmann::json& j,
                                  const TradeConfig* fallback = nullptr);

nlohmann::json toJson(const domain::RiskLimits& limits);

}  // namespace tradegate
