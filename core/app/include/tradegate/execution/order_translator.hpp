#pragma once

#include "tradegate/domain/order.hpp"
#include "tradegate/domain/trading_decision.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// OrderTranslator - decision → concrete Order
// -----------------------------------------------------------------------------
//
// @brief  Maps (ticker, action, quantity, price?) onto a MARKET Order, or
//         nothing when there is no trade to make.
//
// @details
// Side mapping:
//   buy   → BUY      sell  → SELL
//   cover → BUY      short → SELL
// Short and sell produce identical orders; the caller's portfolio
// bookkeeping is what distinguishes opening a short from closing a long.
//
// Market detection is best-effort, based only on the symbol's shape:
//   5 ASCII digits → HK
//   6 ASCII digits → CN
//   anything else  → US
// It is not validated against any exchange listing.
//
// A supplied price is attached to the MARKET order for risk estimation; it
// never turns the order into a LIMIT order.
//
// Stateless; safe to share between threads.
// -----------------------------------------------------------------------------
class OrderTranslator {
 public:
  // hold, quantity <= 0, or an unrecognized action → nullopt.
  std::optional<domain::Order> translate(
      const std::string& ticker, const std::string& action,
      std::int64_t quantity,
      std::optional<double> price = std::nullopt) const;

  std::optional<domain::Order> translate(
      const std::string& ticker, domain::TradeAction action,
      std::int64_t quantity,
      std::optional<double> price = std::nullopt) const;

  static domain::MarketType detectMarket(const std::string& symbol);

  // -------------------------------------------------------------------------
  // toGatewaySymbol
  // -------------------------------------------------------------------------
  // @brief  Prefixes a symbol with its gateway exchange code.
  //
  // @details
  //   HK           → "HK.<code>"
  //   CN, leading 6 → "SH.<code>" (Shanghai)
  //   CN otherwise → "SZ.<code>" (Shenzhen)
  //   US           → "US.<code>"
  // Symbols already containing '.' are returned unchanged.
  // -------------------------------------------------------------------------
  static std::string toGatewaySymbol(const std::string& symbol,
                                     domain::MarketType market);

  // Inverse of toGatewaySymbol: strips a leading "XX." exchange prefix.
  static std::string fromGatewaySymbol(const std::string& gateway_symbol);
};

}  // namespace tradegate
