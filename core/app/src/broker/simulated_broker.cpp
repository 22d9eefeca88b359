#include "tradegate/broker/simulated_broker.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace tradegate {

SimulatedBroker::SimulatedBroker(const TradeConfig& config,
                                 const ITimeProvider& clock,
                                 IBroker* quote_source)
    : config_(config),
      clock_(clock),
      quote_source_(quote_source),
      cash_(config.paper_starting_cash) {
  validateTradeConfig(config_);
}

SimulatedBroker::SimulatedBroker(const TradeConfig& config,
                                 const ITimeProvider& clock,
                                 std::unique_ptr<IBroker> quote_source)
    : config_(config),
      clock_(clock),
      owned_quote_source_(std::move(quote_source)),
      quote_source_(owned_quote_source_.get()),
      cash_(config.paper_starting_cash) {
  validateTradeConfig(config_);
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
bool SimulatedBroker::connect() {
  if (owned_quote_source_ && !owned_quote_source_->isConnected()) {
    if (!owned_quote_source_->connect()) {
      std::cerr << "[SimulatedBroker] WARNING: quote source "
                << owned_quote_source_->name()
                << " unavailable, live quotes disabled\n";
    }
  }
  if (!connected_.exchange(true)) {
    std::cout << "[SimulatedBroker] [DRY RUN] connected. starting cash="
              << config_.paper_starting_cash << " slippage=" << config_.slippage
              << " commission_rate=" << config_.commission_rate << "\n";
  }
  return true;
}

bool SimulatedBroker::disconnect() {
  if (connected_.exchange(false)) {
    std::cout << "[SimulatedBroker] [DRY RUN] disconnected.\n";
  }
  if (owned_quote_source_) {
    owned_quote_source_->disconnect();
  }
  return true;
}

bool SimulatedBroker::isConnected() const { return connected_.load(); }

// -----------------------------------------------------------------------------
// Account snapshots
// -----------------------------------------------------------------------------
Result<domain::AccountInfo> SimulatedBroker::getAccountInfo() {
  if (!isConnected()) {
    return Result<domain::AccountInfo>::failure(ErrorKind::Connection,
                                                "Not connected");
  }
  std::lock_guard lock(mutex_);

  domain::AccountInfo info;
  info.account_id = config_.trading_account.value_or("DRY_RUN");
  info.cash = cash_;
  for (const auto& [symbol, h] : holdings_) {
    const double px = lastPrice(symbol, h);
    info.market_value += static_cast<double>(h.quantity) * px;
    info.unrealized_pnl += static_cast<double>(h.quantity) * (px - h.avg_cost);
  }
  info.total_assets = cash_ + info.market_value;
  info.realized_pnl = realized_pnl_;
  info.buying_power = std::max(0.0, cash_);
  return info;
}

Result<std::vector<domain::Position>> SimulatedBroker::getPositions() {
  if (!isConnected()) {
    return Result<std::vector<domain::Position>>::failure(
        ErrorKind::Connection, "Not connected");
  }
  std::lock_guard lock(mutex_);

  std::vector<domain::Position> out;
  out.reserve(holdings_.size());
  for (const auto& [symbol, h] : holdings_) {
    if (h.quantity == 0) {
      continue;
    }
    domain::Position p;
    p.symbol = symbol;
    p.quantity = h.quantity;
    p.avg_cost = h.avg_cost;
    p.market_price = lastPrice(symbol, h);
    p.market_value = static_cast<double>(h.quantity) * p.market_price;
    p.unrealized_pnl =
        static_cast<double>(h.quantity) * (p.market_price - h.avg_cost);
    out.push_back(p);
  }
  return out;
}

Result<double> SimulatedBroker::getMarketPrice(const std::string& symbol) {
  if (!isConnected()) {
    return Result<double>::failure(ErrorKind::Connection, "Not connected");
  }
  if (auto px = lookupPrice(symbol)) {
    return *px;
  }
  return Result<double>::failure(ErrorKind::Data,
                                 "No market price available for " + symbol);
}

// -----------------------------------------------------------------------------
// submitOrder: deterministic full fill with slippage and commission
// -----------------------------------------------------------------------------
domain::TradeResult SimulatedBroker::submitOrder(const domain::Order& order) {
  const std::int64_t now = clock_.now_ms();

  if (!isConnected()) {
    return domain::failedResult(order, domain::OrderStatus::Failed,
                                "Not connected", now);
  }

  std::optional<double> market = lookupPrice(order.symbol());
  if (!market && order.price() && *order.price() > 0.0) {
    std::cout << "[SimulatedBroker] [DRY RUN] no quote for " << order.symbol()
              << ", using order price " << *order.price() << "\n";
    market = order.price();
  }
  if (!market) {
    std::cerr << "[SimulatedBroker] [DRY RUN] rejecting " << order.symbol()
              << ": no market price\n";
    return domain::failedResult(
        order, domain::OrderStatus::Rejected,
        "DataError: no market price available for " + order.symbol(), now,
        id_gen_.next());
  }

  const bool is_buy = order.side() == domain::Side::Buy;
  const double fill_price =
      *market * (is_buy ? 1.0 + config_.slippage : 1.0 - config_.slippage);
  const double notional = static_cast<double>(order.quantity()) * fill_price;
  const double commission =
      std::max(config_.min_commission, config_.commission_rate * notional);

  domain::TradeResult result;
  result.order_id = id_gen_.next();
  result.symbol = order.symbol();
  result.side = order.side();
  result.quantity = order.quantity();
  result.filled_quantity = order.quantity();
  result.avg_price = fill_price;
  result.status = domain::OrderStatus::Filled;
  result.submit_time_ms = now;
  result.update_time_ms = now;
  result.commission = commission;

  {
    std::lock_guard lock(mutex_);
    bookFill(order.side(), order.symbol(), order.quantity(), fill_price,
             commission);
    orders_[result.order_id] = result;
  }

  std::cout << "[SimulatedBroker] [DRY RUN] " << result.order_id << " "
            << domain::sideToString(order.side()) << " " << order.quantity()
            << " " << order.symbol() << " @ " << fill_price
            << " (market " << *market << ", commission " << commission
            << ")\n";
  return result;
}

bool SimulatedBroker::cancelOrder(const std::string& order_id) {
  if (!isConnected()) {
    return false;
  }
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    std::cerr << "[SimulatedBroker] [DRY RUN] cancel: unknown order "
              << order_id << "\n";
    return false;
  }
  // Dry-run orders are filled on submission; nothing remains to cancel.
  std::cout << "[SimulatedBroker] [DRY RUN] cancel " << order_id << ": "
            << domain::orderStatusToString(it->second.status) << "\n";
  return true;
}

Result<domain::TradeResult> SimulatedBroker::getOrderStatus(
    const std::string& order_id) {
  if (!isConnected()) {
    return Result<domain::TradeResult>::failure(ErrorKind::Connection,
                                                "Not connected");
  }
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return Result<domain::TradeResult>::failure(
        ErrorKind::Data, "Unknown order id " + order_id);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Quote book / seeding
// -----------------------------------------------------------------------------
void SimulatedBroker::updateQuote(const std::string& symbol, double price) {
  std::lock_guard lock(mutex_);
  pinned_quotes_[symbol] = price;
}

void SimulatedBroker::seedPosition(const std::string& symbol,
                                   std::int64_t quantity, double avg_cost) {
  std::lock_guard lock(mutex_);
  holdings_[symbol] = Holding{quantity, avg_cost};
}

double SimulatedBroker::realizedPnl() const {
  std::lock_guard lock(mutex_);
  return realized_pnl_;
}

std::optional<double> SimulatedBroker::lookupPrice(const std::string& symbol) {
  {
    std::lock_guard lock(mutex_);
    auto it = pinned_quotes_.find(symbol);
    if (it != pinned_quotes_.end()) {
      return it->second;
    }
  }

  if (quote_source_ != nullptr && quote_source_->isConnected()) {
    auto px = quote_source_->getMarketPrice(symbol);
    if (px.ok() && px.value() > 0.0) {
      std::lock_guard lock(mutex_);
      quotes_[symbol] = px.value();
      return px.value();
    }
    std::cerr << "[SimulatedBroker] quote source failed for " << symbol
              << ": "
              << (px.ok() ? std::string("non-positive price")
                          : px.error().message)
              << "\n";
  }

  std::lock_guard lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  std::cerr << "[SimulatedBroker] using last known quote for " << symbol
            << ": " << it->second << "\n";
  return it->second;
}

// -----------------------------------------------------------------------------
// bookFill: cash and signed-position update (caller holds mutex_)
// -----------------------------------------------------------------------------
void SimulatedBroker::bookFill(domain::Side side, const std::string& symbol,
                               std::int64_t quantity, double price,
                               double commission) {
  const double notional = static_cast<double>(quantity) * price;
  const std::int64_t signed_qty =
      side == domain::Side::Buy ? quantity : -quantity;

  cash_ += (side == domain::Side::Buy ? -notional : notional) - commission;

  Holding& h = holdings_[symbol];
  const std::int64_t current = h.quantity;

  if (current == 0 || (current > 0) == (signed_qty > 0)) {
    // Opening or increasing: weighted average cost.
    const std::int64_t total = current + signed_qty;
    h.avg_cost = (static_cast<double>(current) * h.avg_cost +
                  static_cast<double>(signed_qty) * price) /
                 static_cast<double>(total);
    h.quantity = total;
    return;
  }

  const double direction = current > 0 ? 1.0 : -1.0;
  const std::int64_t closed = std::min(std::abs(current), quantity);
  realized_pnl_ += static_cast<double>(closed) * (price - h.avg_cost) * direction;
  h.quantity = current + signed_qty;

  if (h.quantity == 0) {
    h.avg_cost = 0.0;
  } else if ((h.quantity > 0) != (current > 0)) {
    // Crossed zero: the remainder opens at the fill price.
    h.avg_cost = price;
  }
}

double SimulatedBroker::lastPrice(const std::string& symbol,
                                  const Holding& h) const {
  if (auto it = pinned_quotes_.find(symbol); it != pinned_quotes_.end()) {
    return it->second;
  }
  auto it = quotes_.find(symbol);
  return it != quotes_.end() ? it->second : h.avg_cost;
}

}  // namespace tradegate
