#include "tradegate/domain/order.hpp"

#include <stdexcept>
#include <utility>

namespace tradegate {
namespace domain {

Order::Order(std::string symbol, Side side, std::int64_t quantity,
             OrderType order_type, std::optional<double> price,
             MarketType market, std::string time_in_force)
    : symbol_(std::move(symbol)),
      side_(side),
      quantity_(quantity),
      order_type_(order_type),
      price_(price),
      market_(market),
      time_in_force_(std::move(time_in_force)) {
  if (symbol_.empty()) {
    throw std::invalid_argument("Order symbol must not be empty");
  }
  if (quantity_ <= 0) {
    throw std::invalid_argument("Order quantity must be positive, got " +
                                std::to_string(quantity_));
  }
  if (order_type_ != OrderType::Market && !price_.has_value()) {
    throw std::invalid_argument(std::string(orderTypeToString(order_type_)) +
                                " order for " + symbol_ +
                                " requires a price");
  }
}

double Order::notional() const {
  return price_ ? static_cast<double>(quantity_) * *price_ : 0.0;
}

}  // namespace domain
}  // namespace tradegate
