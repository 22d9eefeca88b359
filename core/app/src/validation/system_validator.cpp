#include "tradegate/validation/system_validator.hpp"
#include "tradegate/execution/trade_executor.hpp"
#include "tradegate/portfolio/portfolio.hpp"
#include "tradegate/risk/risk_manager.hpp"
#include "tradegate/time/time_utils.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace tradegate {

namespace {

constexpr const char* kProbeSymbol = "AAPL";

double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

std::string seconds(double s) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << s << " seconds";
  return os.str();
}

bool mentions(const std::string& name, const char* word) {
  return name.find(word) != std::string::npos;
}

}  // namespace

// -----------------------------------------------------------------------------
// ValidationReport
// -----------------------------------------------------------------------------
std::size_t ValidationReport::passedCount() const {
  std::size_t n = 0;
  for (const auto& r : results) {
    if (r.passed) {
      ++n;
    }
  }
  return n;
}

std::size_t ValidationReport::failedCount() const {
  return results.size() - passedCount();
}

nlohmann::json ValidationReport::toJson() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& r : results) {
    list.push_back({
        {"test_name", r.test_name},
        {"passed", r.passed},
        {"message", r.message},
        {"details", r.details},
        {"timestamp", format_iso8601(r.timestamp_ms)},
    });
  }
  const std::size_t total = results.size();
  return {
      {"summary",
       {{"total_tests", total},
        {"passed", passedCount()},
        {"failed", failedCount()},
        {"success_rate",
         total > 0 ? static_cast<double>(passedCount()) /
                         static_cast<double>(total)
                   : 0.0},
        {"timestamp", format_iso8601(timestamp_ms)}}},
      {"results", list},
      {"recommendations", recommendations},
  };
}

// -----------------------------------------------------------------------------
// SystemValidator
// -----------------------------------------------------------------------------
SystemValidator::SystemValidator(const TradeConfig& config,
                                 const ITimeProvider& clock,
                                 BrokerFactory factory)
    : config_(config), clock_(clock), factory_(std::move(factory)) {}

ValidationReport SystemValidator::runFullValidation() {
  std::cout << "[SystemValidator] Starting full validation ("
            << (config_.dry_run ? "dry run" : "LIVE") << ")\n";
  results_.clear();

  validateConfiguration();
  validateConnections();
  validateApiFunctionality();
  validateRiskControls();
  validateOrderManagement();
  validateIntegration();
  validatePerformance();

  ValidationReport report;
  report.results = results_;
  report.recommendations = recommendations();
  report.timestamp_ms = clock_.now_ms();

  std::cout << "[SystemValidator] " << report.passedCount() << "/"
            << report.results.size() << " checks passed.\n";
  return report;
}

bool SystemValidator::quickValidation() {
  results_.clear();
  validateConfiguration();
  validateConnections();

  for (const auto& r : results_) {
    const bool critical = mentions(r.test_name, "Configuration") ||
                          mentions(r.test_name, "Connection");
    if (critical && !r.passed) {
      return false;
    }
  }
  return true;
}

void SystemValidator::addResult(std::string name, bool passed,
                                std::string message, nlohmann::json details) {
  std::cout << "[SystemValidator] " << (passed ? "PASS " : "FAIL ") << name
            << ": " << message << "\n";
  results_.push_back(ValidationResult{std::move(name), passed,
                                      std::move(message), std::move(details),
                                      clock_.now_ms()});
}

// --- 1. configuration --------------------------------------------------------
void SystemValidator::validateConfiguration() {
  try {
    if (config_.broker_host.empty()) {
      addResult("Configuration Completeness", false,
                "Missing required field: broker_host");
    } else {
      addResult("Configuration Completeness", true,
                "All required configuration fields present");
    }

    if (config_.broker_port <= 0 || config_.broker_port > 65535) {
      addResult("Port Configuration", false,
                "Invalid port number: " + std::to_string(config_.broker_port));
    } else {
      addResult("Port Configuration", true,
                "Port configuration valid: " +
                    std::to_string(config_.broker_port));
    }

    if (config_.max_position_size <= 0) {
      addResult("Risk Limits", false, "Invalid max_position_size");
    } else {
      addResult("Risk Limits", true, "Risk limits configuration valid");
    }
  } catch (const std::exception& e) {
    addResult("Configuration Validation", false,
              std::string("Configuration validation error: ") + e.what());
  }
}

// --- 2. connections ----------------------------------------------------------
void SystemValidator::validateConnections() {
  try {
    auto broker = factory_(config_, clock_);
    if (!broker->connect()) {
      addResult("Broker Connection", false,
                "Failed to connect to " + broker->name() + " at " +
                    config_.gatewayEndpoint());
      return;
    }
    addResult("Broker Connection", true,
              "Connected to " + broker->name() +
                  (config_.dry_run ? " (dry run)" : " (live)"));

    auto account = broker->getAccountInfo();
    if (account.ok()) {
      addResult("Account Info Retrieval", true,
                "Retrieved account " + account.value().account_id,
                {{"account_id", account.value().account_id},
                 {"total_assets", account.value().total_assets},
                 {"buying_power", account.value().buying_power}});
    } else {
      addResult("Account Info Retrieval", false,
                account.error().message);
    }
    broker->disconnect();
  } catch (const std::exception& e) {
    addResult("Connection Test", false,
              std::string("Connection test error: ") + e.what());
  }
}

// --- 3. api functionality ----------------------------------------------------
void SystemValidator::validateApiFunctionality() {
  try {
    auto broker = factory_(config_, clock_);
    if (!broker->connect()) {
      addResult("API Functionality", false, "Broker not reachable");
      return;
    }

    auto price = broker->getMarketPrice(kProbeSymbol);
    if (price.ok() && price.value() > 0.0) {
      addResult("Market Data Retrieval", true,
                std::string(kProbeSymbol) + " price retrieved",
                {{"symbol", kProbeSymbol}, {"price", price.value()}});
    } else {
      addResult("Market Data Retrieval", false,
                price.ok() ? "Non-positive price" : price.error().message);
    }

    auto positions = broker->getPositions();
    if (positions.ok()) {
      addResult("Position Retrieval", true,
                "Retrieved " + std::to_string(positions.value().size()) +
                    " position(s)");
    } else {
      addResult("Position Retrieval", false, positions.error().message);
    }
    broker->disconnect();
  } catch (const std::exception& e) {
    addResult("API Functionality", false,
              std::string("API functionality error: ") + e.what());
  }
}

// --- 4. risk controls --------------------------------------------------------
void SystemValidator::validateRiskControls() {
  try {
    const nlohmann::json test_limits = {
        {"max_portfolio_value", 100000.0},
        {"max_daily_loss", 5000.0},
        {"max_position_concentration", 0.20},
        {"max_daily_trades", 50},
        {"max_leverage", 2.0},
        {"max_drawdown", 0.10},
    };
    RiskManager risk(loadRiskLimits(test_limits), clock_);

    const nlohmann::json summary = risk.riskSummary();
    if (summary.contains("limits") && !summary.at("limits").empty()) {
      addResult("Risk Limits Initialization", true,
                "Risk limits initialized successfully");
    } else {
      addResult("Risk Limits Initialization", false,
                "Failed to initialize risk limits");
    }

    const domain::Order mock_order(kProbeSymbol, domain::Side::Buy, 100);
    domain::AccountInfo mock_account;
    mock_account.account_id = "test";
    mock_account.total_assets = 50000.0;
    mock_account.cash = 25000.0;
    mock_account.buying_power = 25000.0;

    const RiskVerdict verdict = risk.validateOrder(mock_order, mock_account, {});
    addResult("Trade Risk Validation", true,
              std::string("Risk validation completed: ") +
                  domain::riskLevelToString(verdict.level),
              {{"approved", verdict.approved}, {"messages", verdict.reason}});
  } catch (const std::exception& e) {
    addResult("Risk Controls", false,
              std::string("Risk control validation error: ") + e.what());
  }
}

// --- 5. order management -----------------------------------------------------
void SystemValidator::validateOrderManagement() {
  if (!config_.dry_run) {
    addResult("Order Management", true,
              "Skipping order tests in live mode for safety");
    return;
  }

  try {
    auto broker = factory_(config_, clock_);
    if (!broker->connect()) {
      addResult("Order Management", false, "Broker not reachable");
      return;
    }

    const domain::Order probe(kProbeSymbol, domain::Side::Buy, 1);
    const domain::TradeResult result = broker->submitOrder(probe);
    const char* status = domain::orderStatusToString(result.status);

    if (result.status == domain::OrderStatus::Filled ||
        result.status == domain::OrderStatus::Submitted) {
      addResult("Order Submission", true,
                std::string("Order submitted successfully: ") + status,
                {{"order_id", result.order_id}, {"symbol", result.symbol}});
    } else {
      addResult("Order Submission", false,
                std::string("Order submission failed: ") + status,
                {{"error", result.error_msg ? nlohmann::json(*result.error_msg)
                                            : nlohmann::json(nullptr)}});
    }
    broker->disconnect();
  } catch (const std::exception& e) {
    addResult("Order Management", false,
              std::string("Order management error: ") + e.what());
  }
}

// --- 6. integration ----------------------------------------------------------
void SystemValidator::validateIntegration() {
  try {
    auto broker = factory_(config_, clock_);
    RiskManager risk(domain::RiskLimits{}, clock_);
    TradeExecutor executor(*broker, risk, config_, clock_);

    if (!executor.connect()) {
      addResult("Executor Integration", false,
                "Failed to connect trade executor");
      return;
    }
    addResult("Executor Integration", true,
              "Trade executor connected successfully");

    if (config_.dry_run) {
      Portfolio portfolio(10000.0, 0.5);
      const std::int64_t executed =
          executor.execute(kProbeSymbol, "buy", 1, 150.0, portfolio);
      addResult("Portfolio Integration", executed > 0,
                "Portfolio integration test: " + std::to_string(executed) +
                    " shares executed");
    }
    executor.disconnect();
  } catch (const std::exception& e) {
    addResult("System Integration", false,
              std::string("Integration validation error: ") + e.what());
  }
}

// --- 7. performance ----------------------------------------------------------
void SystemValidator::validatePerformance() {
  try {
    auto broker = factory_(config_, clock_);

    auto start = std::chrono::steady_clock::now();
    const bool connected = broker->connect();
    const double connect_s = secondsSince(start);

    if (!connected) {
      addResult("Connection Performance", false,
                "Could not establish connection for performance test");
      return;
    }
    addResult("Connection Performance", connect_s < kMaxConnectSeconds,
              "Connection time: " + seconds(connect_s));

    start = std::chrono::steady_clock::now();
    auto price = broker->getMarketPrice(kProbeSymbol);
    const double data_s = secondsSince(start);
    addResult("Data Retrieval Performance", data_s < kMaxDataSeconds,
              "Data retrieval time: " + seconds(data_s),
              {{"price_available", price.ok()}});

    broker->disconnect();
  } catch (const std::exception& e) {
    addResult("Performance Validation", false,
              std::string("Performance validation error: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// recommendations()
// -----------------------------------------------------------------------------
std::vector<std::string> SystemValidator::recommendations() const {
  std::vector<std::string> out;
  bool any_failed = false;
  bool connection_failed = false;
  bool config_failed = false;
  bool risk_failed = false;

  for (const auto& r : results_) {
    if (r.passed) {
      continue;
    }
    any_failed = true;
    connection_failed |= mentions(r.test_name, "Connection");
    config_failed |= mentions(r.test_name, "Configuration");
    risk_failed |= mentions(r.test_name, "Risk");
  }

  if (any_failed) {
    out.push_back(
        "Address failed validation tests before proceeding with live "
        "trading");
  }
  if (connection_failed) {
    out.push_back("Ensure the broker gateway is running and reachable at " +
                  config_.gatewayEndpoint());
  }
  if (config_failed) {
    out.push_back("Review and correct trading configuration");
  }
  if (risk_failed) {
    out.push_back("Review risk control settings");
  }
  if (!any_failed) {
    out.push_back("All validations passed - system ready for trading");
  }
  return out;
}

}  // namespace tradegate
