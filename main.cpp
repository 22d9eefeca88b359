// -----------------------------------------------------------------------------
// tradegate - single executable entry point.
//
// Usage:
//   tradegate validate [--quick] [--output <report.json>]
//   tradegate run <decisions.json> [<risk_limits.json>]
//
//   validate  Runs the SystemValidator and prints the report as JSON
//             (--quick: configuration + connection only, exit code only).
//   run       Loads a decision batch {ticker: {action, quantity, ...}},
//             starts a TradingSession, runs the batch once and prints the
//             execution results, risk summary and account summary.
//
// Configuration comes from the environment (TradeConfig::fromEnvironment()).
// Live mode (ENABLE_LIVE_TRADING=true) requires typing the exact phrase
// "CONFIRM LIVE TRADING" on stdin before any order is routed.
//
// Exit codes: 0 success, 1 runtime failure, 2 usage / configuration error.
// -----------------------------------------------------------------------------

#include "tradegate/config/trade_config.hpp"
#include "tradegate/domain/trading_decision.hpp"
#include "tradegate/engine/trading_session.hpp"
#include "tradegate/time/live_time_provider.hpp"
#include "tradegate/validation/system_validator.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kConfirmPhrase = "CONFIRM LIVE TRADING";

void printUsage() {
  std::cerr << "usage:\n"
            << "  tradegate validate [--quick] [--output <report.json>]\n"
            << "  tradegate run <decisions.json> [<risk_limits.json>]\n";
}

nlohmann::json readJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  return nlohmann::json::parse(in);
}

void printMode(const tradegate::TradeConfig& config) {
  std::cout << "[main] Mode: " << (config.dry_run ? "DRY RUN" : "LIVE")
            << " | gateway " << config.gatewayEndpoint()
            << " | short selling "
            << (config.enable_short_selling ? "enabled" : "disabled") << "\n";
  if (config.dry_run) {
    std::cout << "[main] DRY RUN MODE - no real trades will be executed\n";
  }
}

bool confirmLiveTrading() {
  std::cout << "[main] WARNING: LIVE TRADING MODE - real money at risk.\n"
            << "Type '" << kConfirmPhrase
            << "' to proceed with real money: " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) {
    return false;
  }
  return line == kConfirmPhrase;
}

int runValidate(const tradegate::TradeConfig& config,
                const tradegate::ITimeProvider& clock, int argc, char** argv) {
  bool quick = false;
  std::string output;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--quick") {
      quick = true;
    } else if (arg == "--output" && i + 1 < argc) {
      output = argv[++i];
    } else {
      printUsage();
      return 2;
    }
  }

  tradegate::SystemValidator validator(config, clock);
  if (quick) {
    const bool ok = validator.quickValidation();
    std::cout << "[main] Quick validation " << (ok ? "PASSED" : "FAILED")
              << "\n";
    return ok ? 0 : 1;
  }

  const tradegate::ValidationReport report = validator.runFullValidation();
  const nlohmann::json j = report.toJson();
  std::cout << j.dump(2) << "\n";

  if (!output.empty()) {
    std::ofstream out(output);
    if (!out) {
      std::cerr << "[main] Cannot write report to " << output << "\n";
      return 1;
    }
    out << j.dump(2) << "\n";
    std::cout << "[main] Validation report saved to " << output << "\n";
  }
  return report.allPassed() ? 0 : 1;
}

int runBatch(const tradegate::TradeConfig& config,
             const tradegate::ITimeProvider& clock, int argc, char** argv) {
  if (argc < 3) {
    printUsage();
    return 2;
  }

  const tradegate::domain::DecisionBatch batch =
      tradegate::domain::parseDecisions(readJsonFile(argv[2]));
  const tradegate::domain::RiskLimits limits =
      argc > 3 ? tradegate::loadRiskLimits(readJsonFile(argv[3]), &config)
               : tradegate::loadRiskLimits(nlohmann::json::object(), &config);

  std::cout << "[main] " << batch.size() << " decision(s) loaded from "
            << argv[2] << "\n";

  tradegate::TradingSession session(config, limits, clock);
  if (!session.start()) {
    std::cerr << "[main] Could not start trading session.\n";
    return 1;
  }

  const tradegate::BatchReport report = session.runBatch(batch);

  nlohmann::json out = report.toJson();
  out["risk_summary"] = session.riskManager().riskSummary();
  out["account_summary"] = session.executor().accountSummary();
  out["portfolio"] = session.portfolio().toJson();
  std::cout << out.dump(2) << "\n";

  session.stop();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage();
    return 2;
  }
  const std::string command = argv[1];

  tradegate::TradeConfig config;
  try {
    config = tradegate::TradeConfig::fromEnvironment();
  } catch (const tradegate::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 2;
  }

  printMode(config);
  tradegate::LiveTimeProvider clock;

  try {
    if (command == "validate") {
      return runValidate(config, clock, argc, argv);
    }
    if (command == "run") {
      if (!config.dry_run && !confirmLiveTrading()) {
        std::cout << "[main] Live trading cancelled.\n";
        return 0;
      }
      return runBatch(config, clock, argc, argv);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  printUsage();
  return 2;
}
