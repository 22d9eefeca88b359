#pragma once

#include "tradegate/domain/order.hpp"
#include "tradegate/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// TradeResult - outcome of submitting an Order to a broker
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct returned by IBroker::submitOrder and
//         IBroker::getOrderStatus.
//
// @details
// Invariants kept by every producer:
//   - 0 <= filled_quantity <= quantity
//   - avg_price has a value iff filled_quantity > 0
//   - error_msg has a value iff status is Rejected or Failed
//
// Timestamps are epoch milliseconds taken from the injected ITimeProvider
// (see time_utils.hpp for conversions).
// -----------------------------------------------------------------------------
struct TradeResult {
  std::string order_id;
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  std::int64_t filled_quantity{0};
  std::optional<double> avg_price;
  OrderStatus status{OrderStatus::Pending};
  std::int64_t submit_time_ms{0};
  std::optional<std::int64_t> update_time_ms;
  std::optional<std::string> error_msg;
  double commission{0.0};

  bool hasFill() const { return filled_quantity > 0; }
};

// Builds a zero-fill Rejected/Failed result for `order`.
inline TradeResult failedResult(const Order& order, OrderStatus status,
                                std::string error, std::int64_t now_ms,
                                std::string order_id = "") {
  TradeResult r;
  r.order_id = std::move(order_id);
  r.symbol = order.symbol();
  r.side = order.side();
  r.quantity = order.quantity();
  r.status = status;
  r.submit_time_ms = now_ms;
  r.error_msg = std::move(error);
  return r;
}

}  // namespace domain
}  // namespace tradegate
