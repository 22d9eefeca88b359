#include "tradegate/config/trade_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace tradegate {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::optional<std::string> envString(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

bool envBool(const char* name, bool fallback) {
  auto value = envString(name);
  if (!value) {
    return fallback;
  }
  const std::string v = lowercase(*value);
  return v == "true" || v == "1" || v == "yes" || v == "on";
}

template <typename T>
T envNumber(const char* name, T fallback) {
  auto value = envString(name);
  if (!value) {
    return fallback;
  }
  double parsed = 0.0;
  try {
    std::size_t consumed = 0;
    parsed = std::stod(*value, &consumed);
    if (consumed != value->size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::exception&) {
    throw ConfigError(std::string(name) + " is not a number: '" + *value +
                      "'");
  }

  if (!std::isfinite(parsed)) {
    throw ConfigError(std::string(name) + " must be finite: '" + *value + "'");
  }
  if constexpr (std::is_integral_v<T>) {
    // 2^63 and friends round up as doubles, so the upper bound is exclusive.
    if (parsed < static_cast<double>(std::numeric_limits<T>::min()) ||
        parsed >= static_cast<double>(std::numeric_limits<T>::max()) ||
        parsed != std::trunc(parsed)) {
      throw ConfigError(std::string(name) + " is not a valid integer: '" +
                        *value + "'");
    }
  }
  return static_cast<T>(parsed);
}

void readNumber(const nlohmann::json& j, const char* key, double& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number()) {
    std::cerr << "[Config] WARNING: risk limit '" << key
              << "' is not numeric, using " << out << "\n";
    return;
  }
  out = it->get<double>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Log level
// -----------------------------------------------------------------------------
std::optional<LogLevel> parseLogLevel(const std::string& text) {
  const std::string v = lowercase(text);
  if (v == "debug") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warning" || v == "warn") return LogLevel::Warning;
  if (v == "error") return LogLevel::Error;
  return std::nullopt;
}

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "INFO";
}

// -----------------------------------------------------------------------------
// TradeConfig
// -----------------------------------------------------------------------------
std::string TradeConfig::gatewayEndpoint() const {
  return "tcp://" + broker_host + ":" + std::to_string(broker_port);
}

TradeConfig TradeConfig::fromEnvironment() {
  TradeConfig c;
  c.broker_host = envString("BROKER_HOST").value_or(c.broker_host);
  c.broker_port = envNumber<int>("BROKER_PORT", c.broker_port);
  c.trading_account = envString("BROKER_ACCOUNT_ID");
  c.trading_pwd = envString("BROKER_TRADING_PWD");
  c.request_timeout_ms =
      envNumber<int>("BROKER_TIMEOUT_MS", c.request_timeout_ms);
  c.dry_run = !envBool("ENABLE_LIVE_TRADING", false);
  c.max_position_size =
      envNumber<std::int64_t>("MAX_POSITION_SIZE", c.max_position_size);
  c.max_daily_trades = envNumber<long>("MAX_DAILY_TRADES", c.max_daily_trades);
  c.max_order_value = envNumber<double>("MAX_ORDER_VALUE", c.max_order_value);
  c.enable_short_selling =
      envBool("ENABLE_SHORT_SELLING", c.enable_short_selling);
  c.log_level = envString("LOG_LEVEL").value_or(c.log_level);

  validateTradeConfig(c);
  return c;
}

void validateTradeConfig(const TradeConfig& c) {
  if (c.broker_host.empty()) {
    throw ConfigError("broker_host must not be empty");
  }
  if (c.broker_port <= 0 || c.broker_port > 65535) {
    throw ConfigError("broker_port must be in (0, 65535], got " +
                      std::to_string(c.broker_port));
  }
  if (c.max_position_size <= 0) {
    throw ConfigError("max_position_size must be positive, got " +
                      std::to_string(c.max_position_size));
  }
  if (c.max_daily_trades <= 0) {
    throw ConfigError("max_daily_trades must be positive, got " +
                      std::to_string(c.max_daily_trades));
  }
  for (double v : {c.max_order_value, c.slippage, c.commission_rate,
                   c.min_commission, c.paper_starting_cash,
                   c.margin_requirement}) {
    if (!std::isfinite(v)) {
      throw ConfigError("numeric settings must be finite");
    }
  }
  if (c.max_order_value <= 0.0) {
    throw ConfigError("max_order_value must be positive");
  }
  if (c.request_timeout_ms <= 0) {
    throw ConfigError("request_timeout_ms must be positive");
  }
  if (c.slippage < 0.0 || c.commission_rate < 0.0 || c.min_commission < 0.0) {
    throw ConfigError("slippage and commission settings must be >= 0");
  }
  if (c.paper_starting_cash < 0.0) {
    throw ConfigError("paper_starting_cash must be >= 0");
  }
  if (c.margin_requirement < 0.0) {
    throw ConfigError("margin_requirement must be >= 0");
  }
  if (!parseLogLevel(c.log_level)) {
    throw ConfigError("unknown log_level '" + c.log_level + "'");
  }
}

nlohmann::json toJson(const TradeConfig& c) {
  nlohmann::json j;
  j["broker_host"] = c.broker_host;
  j["broker_port"] = c.broker_port;
  j["trading_account"] = c.trading_account
                             ? nlohmann::json(*c.trading_account)
                             : nlohmann::json(nullptr);
  j["trading_pwd"] =
      c.trading_pwd ? nlohmann::json("***") : nlohmann::json(nullptr);
  j["request_timeout_ms"] = c.request_timeout_ms;
  j["dry_run"] = c.dry_run;
  j["max_position_size"] = c.max_position_size;
  j["max_daily_trades"] = c.max_daily_trades;
  j["max_order_value"] = c.max_order_value;
  j["enable_short_selling"] = c.enable_short_selling;
  j["log_level"] = c.log_level;
  return j;
}

// -----------------------------------------------------------------------------
// Risk limits
// -----------------------------------------------------------------------------
domain::RiskLimits loadRiskLimits(const nlohmann::json& j,
                                  const TradeConfig* fallback) {
  domain::RiskLimits limits;
  if (fallback != nullptr) {
    limits.max_position_size =
        static_cast<double>(fallback->max_position_size);
    limits.max_daily_trades = fallback->max_daily_trades;
  }

  if (!j.is_object()) {
    return limits;
  }

  readNumber(j, "max_position_size", limits.max_position_size);
  readNumber(j, "max_portfolio_value", limits.max_portfolio_value);
  readNumber(j, "max_daily_loss", limits.max_daily_loss);
  readNumber(j, "max_position_concentration",
             limits.max_position_concentration);
  readNumber(j, "max_sector_concentration", limits.max_sector_concentration);
  readNumber(j, "min_cash_reserve", limits.min_cash_reserve);
  readNumber(j, "max_leverage", limits.max_leverage);
  readNumber(j, "max_drawdown", limits.max_drawdown);

  double trades = static_cast<double>(limits.max_daily_trades);
  readNumber(j, "max_trades_per_day", trades);
  readNumber(j, "max_daily_trades", trades);
  limits.max_daily_trades = static_cast<long>(trades);

  return limits;
}

nlohmann::json toJson(const domain::RiskLimits& l) {
  return {
      {"max_position_size", l.max_position_size},
      {"max_portfolio_value", l.max_portfolio_value},
      {"max_daily_loss", l.max_daily_loss},
      {"max_position_concentration", l.max_position_concentration},
      {"max_sector_concentration", l.max_sector_concentration},
      {"max_daily_trades", l.max_daily_trades},
      {"min_cash_reserve", l.min_cash_reserve},
      {"max_leverage", l.max_leverage},
      {"max_drawdown", l.max_drawdown},
  };
}

}  // namespace tradegate
