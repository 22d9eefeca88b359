#pragma once

#include "tradegate/core/result.hpp"
#include "tradegate/domain/account_info.hpp"
#include "tradegate/domain/order.hpp"
#include "tradegate/domain/position.hpp"
#include "tradegate/domain/trade_result.hpp"

#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// IBroker - capability interface for a brokerage account
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of operations the execution layer needs from a broker.
//         The trade executor, risk manager and validation harness depend
//         only on this interface.
//
// @details
// Implementations:
//   - SimulatedBroker → dry run; paper account with deterministic fills.
//   - GatewayBroker   → JSON request/reply to a broker gateway over ZeroMQ.
//
// Contract every implementation honours:
//   - connect()/disconnect() are idempotent.
//   - While disconnected, every other call fails with ErrorKind::Connection
//     (submitOrder returns a Failed TradeResult instead).
//   - submitOrder never throws; internal failures become Rejected/Failed
//     results with error_msg set, and 0 <= filled_quantity <= quantity.
//   - No call retries on its own; callers decide what to do with a failure.
//
// Thread model:
//   Calls may block on network I/O (GatewayBroker). Implementations
//   serialize their own internal state; callers must not hold risk or
//   portfolio locks across a broker call.
// -----------------------------------------------------------------------------
class IBroker {
 public:
  virtual ~IBroker() = default;

  virtual bool connect() = 0;
  virtual bool disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual Result<domain::AccountInfo> getAccountInfo() = 0;
  virtual Result<std::vector<domain::Position>> getPositions() = 0;
  virtual Result<double> getMarketPrice(const std::string& symbol) = 0;

  virtual domain::TradeResult submitOrder(const domain::Order& order) = 0;
  virtual bool cancelOrder(const std::string& order_id) = 0;
  virtual Result<domain::TradeResult> getOrderStatus(
      const std::string& order_id) = 0;

  // Short label for logs and reports ("simulated", "gateway").
  virtual std::string name() const = 0;
};

}  // namespace tradegate
