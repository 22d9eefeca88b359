#include "tradegate/broker/gateway_broker.hpp"
#include "tradegate/execution/order_translator.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tradegate {

namespace {

domain::Side sideFromString(const std::string& s) {
  return s == "SELL" ? domain::Side::Sell : domain::Side::Buy;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
GatewayBroker::GatewayBroker(const TradeConfig& config,
                             const ITimeProvider& clock, std::string endpoint)
    : config_(config),
      clock_(clock),
      endpoint_(endpoint.empty() ? config.gatewayEndpoint()
                                 : std::move(endpoint)) {
  validateTradeConfig(config_);
}

GatewayBroker::~GatewayBroker() { disconnect(); }

// -----------------------------------------------------------------------------
// connect(): open socket, ping, pick account
// -----------------------------------------------------------------------------
bool GatewayBroker::connect() {
  if (connected_.load()) {
    return true;
  }

  auto ping = request({{"op", "ping"}});
  if (!ping.ok()) {
    std::cerr << "[GatewayBroker] connect to " << endpoint_ << " failed: "
              << ping.error().message << "\n";
    return false;
  }

  auto accounts = request({{"op", "accounts"}});
  if (!accounts.ok()) {
    std::cerr << "[GatewayBroker] account list failed: "
              << accounts.error().message << "\n";
    return false;
  }

  std::string selected;
  try {
    const auto& list = accounts.value();
    if (config_.trading_account) {
      for (const auto& acc : list) {
        if (acc.at("acc_id").get<std::string>() == *config_.trading_account) {
          selected = *config_.trading_account;
        }
      }
      if (selected.empty()) {
        std::cerr << "[GatewayBroker] configured account "
                  << *config_.trading_account << " not offered by gateway\n";
        return false;
      }
    } else if (list.is_array() && !list.empty()) {
      selected = list.front().at("acc_id").get<std::string>();
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[GatewayBroker] malformed account list: " << e.what()
              << "\n";
    return false;
  }

  if (selected.empty()) {
    std::cerr << "[GatewayBroker] gateway reported no trading accounts\n";
    return false;
  }

  {
    std::lock_guard lock(account_mutex_);
    account_id_ = selected;
  }
  connected_.store(true);
  std::cout << "[GatewayBroker] connected to " << endpoint_
            << " account=" << selected << "\n";
  return true;
}

bool GatewayBroker::disconnect() {
  const bool was_connected = connected_.exchange(false);
  {
    std::lock_guard lock(socket_mutex_);
    closeSocket();
  }
  if (was_connected) {
    std::cout << "[GatewayBroker] disconnected from " << endpoint_ << "\n";
  }
  return true;
}

bool GatewayBroker::isConnected() const { return connected_.load(); }

std::string GatewayBroker::accountId() const {
  std::lock_guard lock(account_mutex_);
  return account_id_;
}

// -----------------------------------------------------------------------------
// Account snapshots
// -----------------------------------------------------------------------------
Result<domain::AccountInfo> GatewayBroker::getAccountInfo() {
  auto reply = connectedRequest({{"op", "account"}, {"acc_id", accountId()}});
  if (!reply.ok()) {
    return reply.error();
  }

  try {
    const auto& d = reply.value();
    domain::AccountInfo info;
    info.account_id = accountId();
    info.total_assets = d.at("total_assets").get<double>();
    info.cash = d.at("cash").get<double>();
    info.market_value = d.value("market_value", 0.0);
    info.unrealized_pnl = d.value("unrealized_pnl", 0.0);
    info.realized_pnl = d.value("realized_pnl", 0.0);
    info.buying_power = d.value("buying_power", info.cash);
    info.currency = d.value("currency", std::string("USD"));
    return info;
  } catch (const nlohmann::json::exception& e) {
    return Error{ErrorKind::Data, std::string("malformed account reply: ") +
                                      e.what()};
  }
}

Result<std::vector<domain::Position>> GatewayBroker::getPositions() {
  auto reply =
      connectedRequest({{"op", "positions"}, {"acc_id", accountId()}});
  if (!reply.ok()) {
    return reply.error();
  }

  try {
    std::vector<domain::Position> out;
    for (const auto& p : reply.value()) {
      domain::Position pos;
      pos.symbol =
          OrderTranslator::fromGatewaySymbol(p.at("symbol").get<std::string>());
      pos.quantity = p.at("quantity").get<std::int64_t>();
      pos.avg_cost = p.value("avg_cost", 0.0);
      pos.market_value = p.value("market_value", 0.0);
      pos.unrealized_pnl = p.value("unrealized_pnl", 0.0);
      pos.market_price = p.value("market_price", 0.0);
      out.push_back(pos);
    }
    return out;
  } catch (const nlohmann::json::exception& e) {
    return Error{ErrorKind::Data, std::string("malformed positions reply: ") +
                                      e.what()};
  }
}

Result<double> GatewayBroker::getMarketPrice(const std::string& symbol) {
  const std::string code = OrderTranslator::toGatewaySymbol(
      symbol, OrderTranslator::detectMarket(symbol));
  auto reply = connectedRequest({{"op", "quote"}, {"symbol", code}});
  if (!reply.ok()) {
    return reply.error();
  }

  try {
    const double px = reply.value().at("last_price").get<double>();
    if (px <= 0.0) {
      return Error{ErrorKind::Data, "non-positive price for " + symbol};
    }
    return px;
  } catch (const nlohmann::json::exception& e) {
    return Error{ErrorKind::Data,
                 "malformed quote for " + symbol + ": " + e.what()};
  }
}

// -----------------------------------------------------------------------------
// submitOrder(): unlock, place, interpret
// -----------------------------------------------------------------------------
domain::TradeResult GatewayBroker::submitOrder(const domain::Order& order) {
  const std::int64_t now = clock_.now_ms();

  if (!isConnected()) {
    return domain::failedResult(order, domain::OrderStatus::Failed,
                                "Not connected", now);
  }

  if (config_.trading_pwd) {
    auto unlock =
        connectedRequest({{"op", "unlock"}, {"password", *config_.trading_pwd}});
    if (!unlock.ok()) {
      const bool rejected = unlock.error().kind == ErrorKind::Execution;
      return domain::failedResult(
          order,
          rejected ? domain::OrderStatus::Rejected : domain::OrderStatus::Failed,
          "Failed to unlock trading: " + unlock.error().message, now);
    }
  }

  nlohmann::json payload = {
      {"op", "submit"},
      {"acc_id", accountId()},
      {"symbol",
       OrderTranslator::toGatewaySymbol(order.symbol(), order.market())},
      {"side", domain::sideToString(order.side())},
      {"quantity", order.quantity()},
      {"order_type", domain::orderTypeToString(order.orderType())},
      {"time_in_force", order.timeInForce()},
  };
  payload["price"] = order.price() ? nlohmann::json(*order.price())
                                   : nlohmann::json(nullptr);

  auto reply = connectedRequest(std::move(payload));
  if (!reply.ok()) {
    const Error& err = reply.error();
    // Broker-side refusals are REJECTED; transport problems are FAILED.
    const auto status = err.kind == ErrorKind::Execution
                            ? domain::OrderStatus::Rejected
                            : domain::OrderStatus::Failed;
    std::cerr << "[GatewayBroker] submit " << order.symbol() << " "
              << domain::orderStatusToString(status) << ": " << err.message
              << "\n";
    return domain::failedResult(order, status,
                                std::string(errorKindToString(err.kind)) +
                                    ": " + err.message,
                                now);
  }

  try {
    const auto& d = reply.value();
    domain::TradeResult result;
    result.order_id = d.at("order_id").get<std::string>();
    result.symbol = order.symbol();
    result.side = order.side();
    result.quantity = order.quantity();
    result.status =
        domain::orderStatusFromGateway(d.value("status", std::string()));
    result.filled_quantity = std::clamp<std::int64_t>(
        d.value("dealt_qty", std::int64_t{0}), 0, order.quantity());
    if (result.filled_quantity > 0) {
      const double avg = d.value("dealt_avg_price", 0.0);
      if (avg <= 0.0) {
        std::cerr << "[GatewayBroker] " << result.order_id << " filled "
                  << result.filled_quantity << " " << order.symbol()
                  << " without a fill price\n";
        return domain::failedResult(
            order, domain::OrderStatus::Failed,
            "DataError: fill of " + std::to_string(result.filled_quantity) +
                " reported without a positive dealt_avg_price",
            now, result.order_id);
      }
      result.avg_price = avg;
    }
    result.submit_time_ms = now;
    result.update_time_ms = clock_.now_ms();
    result.commission = d.value("commission", 0.0);
    if (result.status == domain::OrderStatus::Failed ||
        result.status == domain::OrderStatus::Rejected) {
      result.error_msg = d.value("error", std::string("gateway reported ") +
                                              d.value("status", std::string()));
    }

    std::cout << "[GatewayBroker] " << result.order_id << " "
              << domain::sideToString(order.side()) << " " << order.quantity()
              << " " << order.symbol() << " -> "
              << domain::orderStatusToString(result.status) << " (filled "
              << result.filled_quantity << ")\n";
    return result;
  } catch (const nlohmann::json::exception& e) {
    return domain::failedResult(
        order, domain::OrderStatus::Failed,
        std::string("DataError: malformed submit reply: ") + e.what(), now);
  }
}

bool GatewayBroker::cancelOrder(const std::string& order_id) {
  auto reply = connectedRequest(
      {{"op", "cancel"}, {"acc_id", accountId()}, {"order_id", order_id}});
  if (!reply.ok()) {
    std::cerr << "[GatewayBroker] cancel " << order_id
              << " failed: " << reply.error().message << "\n";
    return false;
  }
  return true;
}

Result<domain::TradeResult> GatewayBroker::getOrderStatus(
    const std::string& order_id) {
  auto reply = connectedRequest(
      {{"op", "order_status"}, {"acc_id", accountId()}, {"order_id", order_id}});
  if (!reply.ok()) {
    return reply.error();
  }

  try {
    const auto& d = reply.value();
    domain::TradeResult result;
    result.order_id = d.value("order_id", order_id);
    result.symbol =
        OrderTranslator::fromGatewaySymbol(d.at("symbol").get<std::string>());
    result.side = sideFromString(d.value("side", std::string("BUY")));
    result.quantity = d.at("qty").get<std::int64_t>();
    result.status =
        domain::orderStatusFromGateway(d.value("status", std::string()));
    result.filled_quantity = std::clamp<std::int64_t>(
        d.value("dealt_qty", std::int64_t{0}), 0, result.quantity);
    if (result.filled_quantity > 0) {
      const double avg = d.value("dealt_avg_price", 0.0);
      if (avg <= 0.0) {
        return Error{ErrorKind::Data, "order " + result.order_id +
                                          " filled without a positive "
                                          "dealt_avg_price"};
      }
      result.avg_price = avg;
    }
    result.update_time_ms = clock_.now_ms();
    if (result.status == domain::OrderStatus::Failed) {
      result.error_msg = d.value("error", std::string("gateway reported ") +
                                              d.value("status", std::string()));
    }
    return result;
  } catch (const nlohmann::json::exception& e) {
    return Error{ErrorKind::Data,
                 std::string("malformed order_status reply: ") + e.what()};
  }
}

// -----------------------------------------------------------------------------
// Transport
// -----------------------------------------------------------------------------
Result<nlohmann::json> GatewayBroker::connectedRequest(nlohmann::json payload) {
  if (!isConnected()) {
    return Error{ErrorKind::Connection, "Not connected"};
  }
  return request(std::move(payload));
}

Result<nlohmann::json> GatewayBroker::request(nlohmann::json payload) {
  const std::string op = payload.value("op", std::string());
  const std::string body = payload.dump();

  std::lock_guard lock(socket_mutex_);

  try {
    if (!socket_) {
      openSocket();
    }

    zmq::send_result_t sent =
        socket_->send(zmq::buffer(body), zmq::send_flags::none);
    if (!sent.has_value()) {
      closeSocket();
      return Error{ErrorKind::Timeout, "could not send '" + op + "' to " +
                                           endpoint_};
    }

    zmq::message_t reply;
    zmq::recv_result_t received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      // The REQ socket is stuck waiting for this reply; start over.
      closeSocket();
      return Error{ErrorKind::Timeout,
                   "no reply to '" + op + "' within " +
                       std::to_string(config_.request_timeout_ms) + " ms"};
    }

    auto j = nlohmann::json::parse(reply.to_string());
    if (!j.value("ok", false)) {
      return Error{ErrorKind::Execution,
                   j.value("error", std::string("gateway error"))};
    }
    return j.contains("data") ? j["data"] : nlohmann::json();

  } catch (const zmq::error_t& e) {
    closeSocket();
    return Error{ErrorKind::Connection,
                 "'" + op + "' transport error: " + e.what()};
  } catch (const nlohmann::json::exception& e) {
    return Error{ErrorKind::Data, "'" + op + "' bad reply: " + e.what()};
  }
}

void GatewayBroker::openSocket() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, config_.request_timeout_ms);
  socket_->set(zmq::sockopt::sndtimeo, config_.request_timeout_ms);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

void GatewayBroker::closeSocket() {
  if (socket_) {
    socket_->close();
    socket_.reset();
  }
}

}  // namespace tradegate
