#include "tradegate/domain/trading_decision.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tradegate {
namespace domain {

const char* tradeActionToString(TradeAction action) {
  switch (action) {
    case TradeAction::Buy:   return "buy";
    case TradeAction::Sell:  return "sell";
    case TradeAction::Short: return "short";
    case TradeAction::Cover: return "cover";
    case TradeAction::Hold:  return "hold";
  }
  return "hold";
}

std::optional<TradeAction> parseTradeAction(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "buy") return TradeAction::Buy;
  if (lower == "sell") return TradeAction::Sell;
  if (lower == "short") return TradeAction::Short;
  if (lower == "cover") return TradeAction::Cover;
  if (lower == "hold") return TradeAction::Hold;
  return std::nullopt;
}

DecisionBatch parseDecisions(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("decision batch must be a JSON object");
  }

  DecisionBatch batch;
  for (const auto& item : j.items()) {
    const std::string ticker = item.key();
    const nlohmann::json& entry = item.value();
    TradingDecision decision;
    if (!entry.is_object()) {
      std::cerr << "[Decisions] WARNING: entry for " << ticker
                << " is not an object, treating as hold\n";
      batch[ticker] = decision;
      continue;
    }

    const auto hold = [&](const std::string& why) {
      std::cerr << "[Decisions] WARNING: " << why << " for " << ticker
                << ", treating as hold\n";
      batch[ticker] = TradingDecision{};
    };

    const auto action_it = entry.find("action");
    if (action_it != entry.end() && !action_it->is_string()) {
      hold("non-string action " + action_it->dump());
      continue;
    }
    const std::string action_text =
        action_it != entry.end() ? action_it->get<std::string>() : "hold";
    if (auto action = parseTradeAction(action_text)) {
      decision.action = *action;
    } else {
      hold("unknown action '" + action_text + "'");
      continue;
    }

    if (const auto qty = entry.find("quantity"); qty != entry.end()) {
      if (qty->is_number_unsigned() &&
          qty->get<std::uint64_t>() >
              static_cast<std::uint64_t>(
                  std::numeric_limits<std::int64_t>::max())) {
        hold("quantity out of range " + qty->dump());
        continue;
      }
      if (!qty->is_number_integer()) {
        hold("non-integer quantity " + qty->dump());
        continue;
      }
      decision.quantity = qty->get<std::int64_t>();
    }

    if (const auto conf = entry.find("confidence");
        conf != entry.end() && conf->is_number()) {
      decision.confidence = conf->get<double>();
    }
    if (const auto why = entry.find("reasoning"); why != entry.end()) {
      if (why->is_string()) {
        decision.reasoning = why->get<std::string>();
      } else {
        std::cerr << "[Decisions] WARNING: non-string reasoning for " << ticker
                  << " ignored\n";
      }
    }

    batch[ticker] = decision;
  }
  return batch;
}

}  // namespace domain
}  // namespace tradegate
