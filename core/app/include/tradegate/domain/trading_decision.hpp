#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// TradeAction - what the decision engine wants done with a ticker
// -----------------------------------------------------------------------------
//
// Short and Sell both become a SELL order; Cover and Buy both become a BUY
// order. Only the portfolio bookkeeping tells them apart.
// -----------------------------------------------------------------------------
enum class TradeAction {
  Buy,
  Sell,
  Short,
  Cover,
  Hold,
};

const char* tradeActionToString(TradeAction action);

// Case-insensitive. Returns nullopt for anything outside
// {buy, sell, short, cover, hold}.
std::optional<TradeAction> parseTradeAction(const std::string& text);

struct TradingDecision {
  TradeAction action{TradeAction::Hold};
  std::int64_t quantity{0};
  double confidence{0.0};
  std::string reasoning;
};

// Ordered by ticker so batches run in a deterministic order.
using DecisionBatch = std::map<std::string, TradingDecision>;

// -----------------------------------------------------------------------------
// parseDecisions
// -----------------------------------------------------------------------------
// @brief  Reads {ticker: {action, quantity, confidence, reasoning}}.
//
// @details
// Missing fields take their defaults. Unknown actions and non-object entries
// become Hold so the ticker is reported but never traded. Throws
// std::invalid_argument if `j` itself is not an object.
// -----------------------------------------------------------------------------
DecisionBatch parseDecisions(const nlohmann::json& j);

}  // namespace domain
}  // namespace tradegate
