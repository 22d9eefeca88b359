// =============================================================================
// system_validator_test.cpp
// =============================================================================
// Unit tests for tradegate::SystemValidator.
//
// Validates:
//   - A healthy dry-run setup passes every phase
//   - Live mode never submits an order and reports the skip as passed
//   - An unreachable broker fails quickValidation() and yields the
//     gateway recommendation
//   - Configuration faults are reported and recommended on
//   - Report JSON shape
//
// Design: the broker factory hands out ScriptedBrokers seeded with an AAPL
// quote. Each phase destroys its broker, so submissions are tallied in the
// fixture.
// =============================================================================

#include "tradegate/validation/system_validator.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include "scripted_broker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

using tradegate::IBroker;
using tradegate::ITimeProvider;
using tradegate::SystemValidator;
using tradegate::TradeConfig;
using tradegate::ValidationReport;
using tradegate::ValidationResult;
using tradegate::test::ScriptedBroker;

class SystemValidatorTest : public ::testing::Test {
 protected:
  tradegate::BrokerFactory factory() {
    return [this](const TradeConfig&, const ITimeProvider&) {
      auto broker = std::make_unique<ScriptedBroker>();
      broker->connect_ok = reachable;
      broker->account = tradegate::test::cashAccount(100'000.0);
      broker->prices = {{"AAPL", 150.0}};
      broker->fill_price = 150.0;
      broker->submit_tally = &submits;
      return std::unique_ptr<IBroker>(std::move(broker));
    };
  }

  const ValidationResult* find(const ValidationReport& report,
                               const std::string& name) const {
    for (const auto& r : report.results) {
      if (r.test_name == name) {
        return &r;
      }
    }
    return nullptr;
  }

  static bool recommends(const ValidationReport& report,
                         const std::string& fragment) {
    return std::any_of(report.recommendations.begin(),
                       report.recommendations.end(),
                       [&](const std::string& r) {
                         return r.find(fragment) != std::string::npos;
                       });
  }

  tradegate::SimulationTimeProvider clock{1'700'000'000'000};
  TradeConfig config;
  bool reachable{true};
  // Submissions across every broker the factory created.
  int submits{0};
};

// -----------------------------------------------------------------------------
// 1. Healthy dry run
// -----------------------------------------------------------------------------
TEST_F(SystemValidatorTest, DryRunPassesEveryPhase) {
  SystemValidator validator(config, clock, factory());
  const ValidationReport report = validator.runFullValidation();

  for (const auto& r : report.results) {
    EXPECT_TRUE(r.passed) << r.test_name << ": " << r.message;
  }
  EXPECT_TRUE(report.allPassed());
  ASSERT_NE(find(report, "Order Submission"), nullptr);
  ASSERT_NE(find(report, "Portfolio Integration"), nullptr);
  ASSERT_NE(find(report, "Market Data Retrieval"), nullptr);
  EXPECT_DOUBLE_EQ(
      find(report, "Market Data Retrieval")->details.at("price").get<double>(),
      150.0);

  ASSERT_EQ(report.recommendations.size(), 1u);
  EXPECT_EQ(report.recommendations.front(),
            "All validations passed - system ready for trading");
}

TEST_F(SystemValidatorTest, QuickValidationPassesWhenReachable) {
  SystemValidator validator(config, clock, factory());
  EXPECT_TRUE(validator.quickValidation());
  EXPECT_EQ(validator.results().size(), 5u);
}

// -----------------------------------------------------------------------------
// 2. Live mode
// -----------------------------------------------------------------------------
TEST_F(SystemValidatorTest, LiveModeSkipsOrderTests) {
  config.dry_run = false;
  SystemValidator validator(config, clock, factory());
  const ValidationReport report = validator.runFullValidation();

  const ValidationResult* skipped = find(report, "Order Management");
  ASSERT_NE(skipped, nullptr);
  EXPECT_TRUE(skipped->passed);
  EXPECT_EQ(skipped->message, "Skipping order tests in live mode for safety");
  EXPECT_EQ(find(report, "Order Submission"), nullptr);
  EXPECT_EQ(find(report, "Portfolio Integration"), nullptr);
  EXPECT_EQ(submits, 0);
}

// -----------------------------------------------------------------------------
// 3. Failures and recommendations
// -----------------------------------------------------------------------------
TEST_F(SystemValidatorTest, UnreachableBrokerFailsQuickValidation) {
  reachable = false;
  SystemValidator validator(config, clock, factory());
  EXPECT_FALSE(validator.quickValidation());
}

TEST_F(SystemValidatorTest, UnreachableBrokerRecommendsGatewayCheck) {
  reachable = false;
  SystemValidator validator(config, clock, factory());
  const ValidationReport report = validator.runFullValidation();

  EXPECT_FALSE(report.allPassed());
  ASSERT_NE(find(report, "Broker Connection"), nullptr);
  EXPECT_FALSE(find(report, "Broker Connection")->passed);
  EXPECT_TRUE(recommends(report, "Address failed validation tests"));
  EXPECT_TRUE(recommends(report, config.gatewayEndpoint()));
  EXPECT_FALSE(recommends(report, "All validations passed"));
}

TEST_F(SystemValidatorTest, BadPortIsReported) {
  config.broker_port = 70000;
  SystemValidator validator(config, clock, factory());
  const ValidationReport report = validator.runFullValidation();

  const ValidationResult* port = find(report, "Port Configuration");
  ASSERT_NE(port, nullptr);
  EXPECT_FALSE(port->passed);
  EXPECT_EQ(port->message, "Invalid port number: 70000");
  EXPECT_TRUE(recommends(report, "Review and correct trading configuration"));
  EXPECT_FALSE(validator.quickValidation());
}

// -----------------------------------------------------------------------------
// 4. Report JSON
// -----------------------------------------------------------------------------
TEST_F(SystemValidatorTest, ReportJsonShape) {
  SystemValidator validator(config, clock, factory());
  const nlohmann::json j = validator.runFullValidation().toJson();

  const auto& summary = j.at("summary");
  EXPECT_EQ(summary.at("total_tests").get<std::size_t>(),
            j.at("results").size());
  EXPECT_EQ(summary.at("failed").get<std::size_t>(), 0u);
  EXPECT_DOUBLE_EQ(summary.at("success_rate").get<double>(), 1.0);
  EXPECT_EQ(summary.at("timestamp"), "2023-11-14T22:13:20.000Z");

  const auto& first = j.at("results").at(0);
  EXPECT_EQ(first.at("test_name"), "Configuration Completeness");
  EXPECT_TRUE(first.at("passed").get<bool>());
  EXPECT_TRUE(first.contains("details"));
  EXPECT_TRUE(j.at("recommendations").is_array());
}
