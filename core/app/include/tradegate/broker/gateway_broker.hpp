#pragma once

#include "tradegate/broker/i_broker.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// GatewayBroker - IBroker speaking JSON to a broker gateway over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  Real-money IBroker. Every capability call is one JSON request on a
//         ZMQ REQ socket followed by one JSON reply.
//
// @details
// Wire format (one JSON object per ZMQ message):
//
//   request : {"op": "<op>", ...arguments}
//   reply   : {"ok": true,  "data": <payload>}
//           | {"ok": false, "error": "<message>"}
//
//   op            arguments                          data
//   ------------  ---------------------------------  ---------------------------
//   ping          -                                  -
//   accounts      -                                  [{"acc_id": "..."}]
//   account       acc_id                             {total_assets, cash,
//                                                     market_value,
//                                                     unrealized_pnl,
//                                                     realized_pnl,
//                                                     buying_power, currency}
//   positions     acc_id                             [{symbol, quantity,
//                                                      avg_cost, market_value,
//                                                      unrealized_pnl,
//                                                      market_price}]
//   quote         symbol                             {"last_price": x}
//   unlock        password                           -
//   submit        acc_id, symbol, side, quantity,    {order_id, status,
//                 order_type, price, time_in_force    dealt_qty,
//                                                     dealt_avg_price}
//   cancel        acc_id, order_id                   -
//   order_status  acc_id, order_id                   {order_id, symbol, side,
//                                                     qty, status, dealt_qty,
//                                                     dealt_avg_price}
//
// Symbols travel in gateway form ("US.AAPL", "HK.00700", "SH.600519") and are
// converted with OrderTranslator::toGatewaySymbol / fromGatewaySymbol.
// Gateway status strings are mapped with orderStatusFromGateway().
//
// Timeouts:
//   ZMQ_RCVTIMEO is set to TradeConfig::request_timeout_ms. A request with
//   no reply in that window returns ErrorKind::Timeout and the REQ socket is
//   closed and reopened, since a REQ socket that missed its reply cannot
//   send again. A timed-out submit is reported as FAILED, never as a hang.
//
// Error boundary:
//   zmq::error_t and nlohmann::json::exception are caught here and turned
//   into Error values / FAILED results. Nothing is retried. A reply that
//   reports dealt_qty > 0 without a positive dealt_avg_price is a DataError
//   (FAILED for submit) so no zero-price fill is ever booked.
//
// Thread model:
//   REQ sockets must strictly alternate send/recv, so every request holds
//   socket_mutex_ for its full round trip.
// -----------------------------------------------------------------------------
class GatewayBroker final : public IBroker {
 public:
  // `endpoint` overrides config.gatewayEndpoint() when non-empty.
  GatewayBroker(const TradeConfig& config, const ITimeProvider& clock,
                std::string endpoint = "");

  ~GatewayBroker() override;

  GatewayBroker(const GatewayBroker&) = delete;
  GatewayBroker& operator=(const GatewayBroker&) = delete;
  GatewayBroker(GatewayBroker&&) = delete;
  GatewayBroker& operator=(GatewayBroker&&) = delete;

  // Opens the socket, pings the gateway and selects the trading account
  // (configured id, or the first one the gateway lists).
  bool connect() override;
  bool disconnect() override;
  bool isConnected() const override;

  Result<domain::AccountInfo> getAccountInfo() override;
  Result<std::vector<domain::Position>> getPositions() override;
  Result<double> getMarketPrice(const std::string& symbol) override;

  domain::TradeResult submitOrder(const domain::Order& order) override;
  bool cancelOrder(const std::string& order_id) override;
  Result<domain::TradeResult> getOrderStatus(
      const std::string& order_id) override;

  std::string name() const override { return "gateway"; }

  const std::string& endpoint() const { return endpoint_; }
  std::string accountId() const;

 private:
  // One round trip. Returns the reply's "data" member (null if absent).
  Result<nlohmann::json> request(nlohmann::json payload);

  // Requires socket_mutex_ held.
  void openSocket();
  void closeSocket();

  Result<nlohmann::json> connectedRequest(nlohmann::json payload);

  const TradeConfig config_;
  const ITimeProvider& clock_;
  const std::string endpoint_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
  std::mutex socket_mutex_;

  std::atomic<bool> connected_{false};

  mutable std::mutex account_mutex_;
  std::string account_id_;
};

}  // namespace tradegate
