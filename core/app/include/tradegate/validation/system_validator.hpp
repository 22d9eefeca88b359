#pragma once

#include "tradegate/broker/broker_factory.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tradegate {

struct ValidationResult {
  std::string test_name;
  bool passed{false};
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::int64_t timestamp_ms{0};
};

struct ValidationReport {
  std::vector<ValidationResult> results;
  std::vector<std::string> recommendations;
  std::int64_t timestamp_ms{0};

  std::size_t passedCount() const;
  std::size_t failedCount() const;
  bool allPassed() const { return failedCount() == 0; }

  // {summary: {total_tests, passed, failed, success_rate, timestamp},
  //  results: [{test_name, passed, message, details, timestamp}],
  //  recommendations: [...]}
  nlohmann::json toJson() const;
};

// -----------------------------------------------------------------------------
// SystemValidator
// -----------------------------------------------------------------------------
//
// @brief  Pre-flight checks run before a session is allowed to trade.
//
// @details
// runFullValidation() phases, in order:
//   1. configuration     completeness, port range, position size limit
//   2. connections       broker connect, account info retrieval
//   3. api functionality market price ("AAPL"), position retrieval
//   4. risk controls     fixed test limits load, mock order validation
//   5. order management  dry run only: 1-share market BUY must come back
//                        FILLED or SUBMITTED. Skipped (passed) when live.
//   6. integration       executor connect; dry run only: executing a
//                        1-share BUY @ 150 against a fresh Portfolio
//                        must execute > 0 shares
//   7. performance       connect < 10 s, market price < 5 s
//
// Each phase creates its own broker through the factory and disconnects it
// when done. An exception inside a phase becomes one failed result named
// after the phase; the remaining phases still run.
//
// quickValidation() runs phases 1 and 2 only and passes iff every result
// whose name mentions "Configuration" or "Connection" passed.
// -----------------------------------------------------------------------------
class SystemValidator {
 public:
  static constexpr double kMaxConnectSeconds = 10.0;
  static constexpr double kMaxDataSeconds = 5.0;

  SystemValidator(const TradeConfig& config, const ITimeProvider& clock,
                  BrokerFactory factory = makeBroker);

  SystemValidator(const SystemValidator&) = delete;
  SystemValidator& operator=(const SystemValidator&) = delete;

  ValidationReport runFullValidation();
  bool quickValidation();

  const std::vector<ValidationResult>& results() const { return results_; }

 private:
  void validateConfiguration();
  void validateConnections();
  void validateApiFunctionality();
  void validateRiskControls();
  void validateOrderManagement();
  void validateIntegration();
  void validatePerformance();

  void addResult(std::string name, bool passed, std::string message,
                 nlohmann::json details = nlohmann::json::object());
  std::vector<std::string> recommendations() const;

  const TradeConfig config_;
  const ITimeProvider& clock_;
  BrokerFactory factory_;

  std::vector<ValidationResult> results_;
};

}  // namespace tradegate
