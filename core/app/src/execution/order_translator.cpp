#include "tradegate/execution/order_translator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace tradegate {

namespace {

bool allDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

}  // namespace

std::optional<domain::Order> OrderTranslator::translate(
    const std::string& ticker, const std::string& action,
    std::int64_t quantity, std::optional<double> price) const {
  auto parsed = domain::parseTradeAction(action);
  if (!parsed) {
    std::cerr << "[OrderTranslator] Unknown action '" << action << "' for "
              << ticker << ", no order\n";
    return std::nullopt;
  }
  return translate(ticker, *parsed, quantity, price);
}

std::optional<domain::Order> OrderTranslator::translate(
    const std::string& ticker, domain::TradeAction action,
    std::int64_t quantity, std::optional<double> price) const {
  if (action == domain::TradeAction::Hold || quantity <= 0 || ticker.empty()) {
    return std::nullopt;
  }

  domain::Side side = (action == domain::TradeAction::Buy ||
                       action == domain::TradeAction::Cover)
                          ? domain::Side::Buy
                          : domain::Side::Sell;

  return domain::Order(ticker, side, quantity, domain::OrderType::Market,
                       price, detectMarket(ticker));
}

domain::MarketType OrderTranslator::detectMarket(const std::string& symbol) {
  if (allDigits(symbol)) {
    if (symbol.size() == 5) return domain::MarketType::HK;
    if (symbol.size() == 6) return domain::MarketType::CN;
  }
  return domain::MarketType::US;
}

std::string OrderTranslator::toGatewaySymbol(const std::string& symbol,
                                             domain::MarketType market) {
  if (symbol.find('.') != std::string::npos) {
    return symbol;
  }
  switch (market) {
    case domain::MarketType::HK:
      return "HK." + symbol;
    case domain::MarketType::CN:
      return (symbol.rfind('6', 0) == 0 ? "SH." : "SZ.") + symbol;
    case domain::MarketType::US:
      break;
  }
  return "US." + symbol;
}

std::string OrderTranslator::fromGatewaySymbol(
    const std::string& gateway_symbol) {
  auto dot = gateway_symbol.find('.');
  if (dot == 2) {
    return gateway_symbol.substr(3);
  }
  return gateway_symbol;
}

}  // namespace tradegate
