// =============================================================================
// trade_config_test.cpp
// =============================================================================
// Unit tests for tradegate::TradeConfig and risk limit loading.
//
// Validates:
//   - Defaults are valid; dry run is the default mode
//   - validateTradeConfig() rejects non-positive port / position size / etc.
//   - fromEnvironment() reads every documented variable
//   - Non-finite, fractional or out-of-range numbers raise ConfigError
//   - JSON view masks the trading password
//   - loadRiskLimits(): defaults, overrides, aliases, config fallback,
//     non-numeric values skipped
//
// Design: environment tests set and clear variables through a fixture so no
// test leaks state into another.
// =============================================================================

#include "tradegate/config/trade_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <limits>

using tradegate::ConfigError;
using tradegate::TradeConfig;
using tradegate::loadRiskLimits;
using tradegate::validateTradeConfig;

class TradeConfigEnvTest : public ::testing::Test {
 protected:
  static constexpr const char* kVars[] = {
      "BROKER_HOST",       "BROKER_PORT",          "BROKER_ACCOUNT_ID",
      "BROKER_TRADING_PWD", "BROKER_TIMEOUT_MS",   "ENABLE_LIVE_TRADING",
      "MAX_POSITION_SIZE", "MAX_DAILY_TRADES",     "MAX_ORDER_VALUE",
      "ENABLE_SHORT_SELLING", "LOG_LEVEL",
  };

  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char* name : kVars) {
      ::unsetenv(name);
    }
  }
};

// -----------------------------------------------------------------------------
// 1. Defaults and validation
// -----------------------------------------------------------------------------
TEST(TradeConfigTest, DefaultsAreValidDryRun) {
  TradeConfig c;
  EXPECT_NO_THROW(validateTradeConfig(c));
  EXPECT_TRUE(c.dry_run);
  EXPECT_FALSE(c.enable_short_selling);
  EXPECT_EQ(c.gatewayEndpoint(), "tcp://127.0.0.1:11111");
}

TEST(TradeConfigTest, RejectsNonFiniteField) {
  TradeConfig c;
  c.slippage = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(validateTradeConfig(c), ConfigError);
}

TEST(TradeConfigTest, RejectsBadPort) {
  TradeConfig c;
  c.broker_port = 0;
  EXPECT_THROW(validateTradeConfig(c), ConfigError);
  c.broker_port = 70000;
  EXPECT_THROW(validateTradeConfig(c), ConfigError);
}

TEST(TradeConfigTest, RejectsNonPositiveLimits) {
  TradeConfig c;
  c.max_position_size = 0;
  EXPECT_THROW(validateTradeConfig(c), ConfigError);

  c = TradeConfig{};
  c.max_daily_trades = -1;
  EXPECT_THROW(validateTradeConfig(c), ConfigError);

  c = TradeConfig{};
  c.max_order_value = 0.0;
  EXPECT_THROW(validateTradeConfig(c), ConfigError);
}

TEST(TradeConfigTest, RejectsEmptyHostAndUnknownLogLevel) {
  TradeConfig c;
  c.broker_host.clear();
  EXPECT_THROW(validateTradeConfig(c), ConfigError);

  c = TradeConfig{};
  c.log_level = "LOUD";
  EXPECT_THROW(validateTradeConfig(c), ConfigError);
}

TEST(TradeConfigTest, JsonMasksPassword) {
  TradeConfig c;
  c.trading_pwd = "hunter2";
  const auto j = tradegate::toJson(c);
  EXPECT_EQ(j.at("trading_pwd"), "***");
  EXPECT_TRUE(j.at("trading_account").is_null());
}

// -----------------------------------------------------------------------------
// 2. Environment
// -----------------------------------------------------------------------------
TEST_F(TradeConfigEnvTest, EmptyEnvironmentGivesDefaults) {
  TradeConfig c = TradeConfig::fromEnvironment();
  EXPECT_TRUE(c.dry_run);
  EXPECT_EQ(c.broker_port, 11111);
  EXPECT_FALSE(c.trading_account.has_value());
}

TEST_F(TradeConfigEnvTest, ReadsEveryVariable) {
  ::setenv("BROKER_HOST", "gateway.local", 1);
  ::setenv("BROKER_PORT", "22222", 1);
  ::setenv("BROKER_ACCOUNT_ID", "ACC-1", 1);
  ::setenv("BROKER_TRADING_PWD", "secret", 1);
  ::setenv("BROKER_TIMEOUT_MS", "750", 1);
  ::setenv("ENABLE_LIVE_TRADING", "true", 1);
  ::setenv("MAX_POSITION_SIZE", "500", 1);
  ::setenv("MAX_DAILY_TRADES", "7", 1);
  ::setenv("MAX_ORDER_VALUE", "1234.5", 1);
  ::setenv("ENABLE_SHORT_SELLING", "YES", 1);
  ::setenv("LOG_LEVEL", "debug", 1);

  TradeConfig c = TradeConfig::fromEnvironment();
  EXPECT_EQ(c.broker_host, "gateway.local");
  EXPECT_EQ(c.broker_port, 22222);
  EXPECT_EQ(c.trading_account.value_or(""), "ACC-1");
  EXPECT_EQ(c.trading_pwd.value_or(""), "secret");
  EXPECT_EQ(c.request_timeout_ms, 750);
  EXPECT_FALSE(c.dry_run);
  EXPECT_EQ(c.max_position_size, 500);
  EXPECT_EQ(c.max_daily_trades, 7);
  EXPECT_DOUBLE_EQ(c.max_order_value, 1234.5);
  EXPECT_TRUE(c.enable_short_selling);
  EXPECT_EQ(c.log_level, "debug");
}

TEST_F(TradeConfigEnvTest, NonNumericVariableThrows) {
  ::setenv("BROKER_PORT", "eleven", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
}

TEST_F(TradeConfigEnvTest, OutOfRangeIntegerThrows) {
  ::setenv("BROKER_PORT", "1e20", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
  ::setenv("BROKER_PORT", "8080.5", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
  ::unsetenv("BROKER_PORT");
  ::setenv("MAX_POSITION_SIZE", "9223372036854775808", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
}

TEST_F(TradeConfigEnvTest, NonFiniteNumberThrows) {
  ::setenv("MAX_ORDER_VALUE", "nan", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
  ::setenv("MAX_ORDER_VALUE", "inf", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
}

TEST_F(TradeConfigEnvTest, InvalidValueFailsValidation) {
  ::setenv("MAX_POSITION_SIZE", "0", 1);
  EXPECT_THROW(TradeConfig::fromEnvironment(), ConfigError);
}

// -----------------------------------------------------------------------------
// 3. Risk limits
// -----------------------------------------------------------------------------
TEST(RiskLimitsConfigTest, EmptyObjectGivesDefaults) {
  auto limits = loadRiskLimits(nlohmann::json::object());
  EXPECT_DOUBLE_EQ(limits.max_daily_loss, 10'000.0);
  EXPECT_DOUBLE_EQ(limits.max_position_concentration, 0.20);
  EXPECT_EQ(limits.max_daily_trades, 100);
}

TEST(RiskLimitsConfigTest, OverridesAndUnknownKeys) {
  auto limits = loadRiskLimits({{"max_daily_loss", 5000.0},
                                {"max_position_concentration", 0.15},
                                {"max_trades_per_day", 25},
                                {"something_else", 1}});
  EXPECT_DOUBLE_EQ(limits.max_daily_loss, 5'000.0);
  EXPECT_DOUBLE_EQ(limits.max_position_concentration, 0.15);
  EXPECT_EQ(limits.max_daily_trades, 25);
}

TEST(RiskLimitsConfigTest, ConfigSuppliesFallbacks) {
  TradeConfig c;
  c.max_position_size = 2'500;
  c.max_daily_trades = 9;
  auto limits = loadRiskLimits(nlohmann::json::object(), &c);
  EXPECT_DOUBLE_EQ(limits.max_position_size, 2'500.0);
  EXPECT_EQ(limits.max_daily_trades, 9);

  limits = loadRiskLimits({{"max_daily_trades", 3}}, &c);
  EXPECT_EQ(limits.max_daily_trades, 3);
}

TEST(RiskLimitsConfigTest, NonNumericValueIsSkipped) {
  auto limits = loadRiskLimits({{"max_daily_loss", "lots"}});
  EXPECT_DOUBLE_EQ(limits.max_daily_loss, 10'000.0);
}
