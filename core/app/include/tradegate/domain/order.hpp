#pragma once

#include "tradegate/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradegate {
namespace domain {

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
  Stop,
  StopLimit,
};

enum class MarketType {
  HK,
  US,
  CN,
};

inline const char* sideToString(Side s) {
  return s == Side::Buy ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType t) {
  switch (t) {
    case OrderType::Market:    return "MARKET";
    case OrderType::Limit:     return "LIMIT";
    case OrderType::Stop:      return "STOP";
    case OrderType::StopLimit: return "STOP_LIMIT";
  }
  return "UNKNOWN";
}

inline const char* marketToString(MarketType m) {
  switch (m) {
    case MarketType::HK: return "HK";
    case MarketType::US: return "US";
    case MarketType::CN: return "CN";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Order - candidate instruction handed to the risk manager and the broker
// -----------------------------------------------------------------------------
//
// @brief  Immutable order value. All fields are fixed at construction; there
//         are no setters.
//
// @details
// The constructor enforces the two structural invariants:
//   - quantity must be > 0
//   - LIMIT, STOP and STOP_LIMIT orders must carry a price
// and throws std::invalid_argument otherwise. A price attached to a MARKET
// order is informational (used for risk estimation and dry-run fallback).
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Order {
 public:
  Order(std::string symbol, Side side, std::int64_t quantity,
        OrderType order_type = OrderType::Market,
        std::optional<double> price = std::nullopt,
        MarketType market = MarketType::US,
        std::string time_in_force = "DAY");

  const std::string& symbol() const { return symbol_; }
  Side side() const { return side_; }
  std::int64_t quantity() const { return quantity_; }
  OrderType orderType() const { return order_type_; }
  const std::optional<double>& price() const { return price_; }
  MarketType market() const { return market_; }
  const std::string& timeInForce() const { return time_in_force_; }

  // quantity × price, or 0 when no price is attached.
  double notional() const;

 private:
  std::string symbol_;
  Side side_;
  std::int64_t quantity_;
  OrderType order_type_;
  std::optional<double> price_;
  MarketType market_;
  std::string time_in_force_;
};

}  // namespace domain
}  // namespace tradegate
