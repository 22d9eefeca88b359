#include "tradegate/portfolio/portfolio.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>

namespace tradegate {

Portfolio::Portfolio(double cash, double margin_requirement)
    : margin_requirement_(margin_requirement), cash_(cash) {}

// -----------------------------------------------------------------------------
// applyFill: route by decision action
// -----------------------------------------------------------------------------
FillEffect Portfolio::applyFill(domain::TradeAction action,
                                const std::string& symbol,
                                std::int64_t quantity, double price) {
  switch (action) {
    case domain::TradeAction::Buy:
      return applyLongBuy(symbol, quantity, price);
    case domain::TradeAction::Sell:
      return applyLongSell(symbol, quantity, price);
    case domain::TradeAction::Short:
      return applyShortOpen(symbol, quantity, price);
    case domain::TradeAction::Cover:
      return applyShortCover(symbol, quantity, price);
    case domain::TradeAction::Hold:
      break;
  }
  return {};
}

// -----------------------------------------------------------------------------
// Long leg
// -----------------------------------------------------------------------------
FillEffect Portfolio::applyLongBuy(const std::string& symbol,
                                   std::int64_t quantity, double price) {
  if (quantity <= 0) {
    return {};
  }
  std::unique_lock lock(mutex_);
  PortfolioPosition& pos = leg(symbol);

  // Weighted average: (q0 * b0 + q * p) / (q0 + q). q0 + q > 0 here.
  const double q0 = static_cast<double>(pos.long_qty);
  const double q = static_cast<double>(quantity);
  pos.long_cost_basis = (q0 * pos.long_cost_basis + q * price) / (q0 + q);
  pos.long_qty += quantity;
  cash_ -= q * price;

  return {quantity, 0.0};
}

FillEffect Portfolio::applyLongSell(const std::string& symbol,
                                    std::int64_t quantity, double price) {
  std::unique_lock lock(mutex_);
  PortfolioPosition& pos = leg(symbol);

  const std::int64_t closed = std::min(quantity, pos.long_qty);
  if (closed <= 0) {
    return {};
  }
  if (closed < quantity) {
    std::cerr << "[Portfolio] WARNING: sell of " << quantity << " " << symbol
              << " exceeds long holding " << pos.long_qty << ", booking "
              << closed << "\n";
  }

  const double q = static_cast<double>(closed);
  const double gain = (price - pos.long_cost_basis) * q;
  realized_[symbol].long_gains += gain;
  pos.long_qty -= closed;
  cash_ += q * price;
  if (pos.long_qty == 0) {
    pos.long_cost_basis = 0.0;
  }

  return {closed, gain};
}

// -----------------------------------------------------------------------------
// Short leg
// -----------------------------------------------------------------------------
FillEffect Portfolio::applyShortOpen(const std::string& symbol,
                                     std::int64_t quantity, double price) {
  if (quantity <= 0) {
    return {};
  }
  std::unique_lock lock(mutex_);
  PortfolioPosition& pos = leg(symbol);

  const double q0 = static_cast<double>(pos.short_qty);
  const double q = static_cast<double>(quantity);
  const double proceeds = q * price;
  const double margin = proceeds * margin_requirement_;

  pos.short_cost_basis = (q0 * pos.short_cost_basis + q * price) / (q0 + q);
  pos.short_qty += quantity;
  pos.short_margin_used += margin;
  margin_used_ += margin;
  cash_ += proceeds - margin;

  return {quantity, 0.0};
}

FillEffect Portfolio::applyShortCover(const std::string& symbol,
                                      std::int64_t quantity, double price) {
  std::unique_lock lock(mutex_);
  PortfolioPosition& pos = leg(symbol);

  const std::int64_t covered = std::min(quantity, pos.short_qty);
  if (covered <= 0) {
    return {};
  }
  if (covered < quantity) {
    std::cerr << "[Portfolio] WARNING: cover of " << quantity << " " << symbol
              << " exceeds short holding " << pos.short_qty << ", booking "
              << covered << "\n";
  }

  const double q = static_cast<double>(covered);
  const double gain = (pos.short_cost_basis - price) * q;
  const double released =
      pos.short_margin_used * q / static_cast<double>(pos.short_qty);

  realized_[symbol].short_gains += gain;
  pos.short_qty -= covered;
  pos.short_margin_used -= released;
  margin_used_ -= released;
  cash_ += released - q * price;
  if (pos.short_qty == 0) {
    pos.short_cost_basis = 0.0;
    pos.short_margin_used = 0.0;
  }

  return {covered, gain};
}

void Portfolio::chargeCommission(double amount) {
  std::unique_lock lock(mutex_);
  cash_ -= amount;
}

// -----------------------------------------------------------------------------
// hydrate / reconcile
// -----------------------------------------------------------------------------
void Portfolio::hydrate(const std::vector<domain::Position>& positions,
                        std::optional<double> cash) {
  std::unique_lock lock(mutex_);
  positions_.clear();
  margin_used_ = 0.0;

  for (const auto& p : positions) {
    if (p.quantity == 0) {
      continue;
    }
    PortfolioPosition& pos = leg(p.symbol);
    if (p.quantity > 0) {
      pos.long_qty = p.quantity;
      pos.long_cost_basis = p.avg_cost;
    } else {
      pos.short_qty = -p.quantity;
      pos.short_cost_basis = p.avg_cost;
      pos.short_margin_used = static_cast<double>(pos.short_qty) *
                              p.avg_cost * margin_requirement_;
      margin_used_ += pos.short_margin_used;
    }
  }
  if (cash) {
    cash_ = *cash;
  }
}

std::vector<PositionDiscrepancy> Portfolio::reconcile(
    const std::vector<domain::Position>& broker_positions) const {
  std::shared_lock lock(mutex_);

  std::map<std::string, std::int64_t> broker;
  for (const auto& p : broker_positions) {
    broker[p.symbol] += p.quantity;
  }

  std::set<std::string> symbols;
  for (const auto& [symbol, qty] : broker) symbols.insert(symbol);
  for (const auto& [symbol, pos] : positions_) symbols.insert(symbol);

  std::vector<PositionDiscrepancy> out;
  for (const auto& symbol : symbols) {
    auto local_it = positions_.find(symbol);
    auto broker_it = broker.find(symbol);
    const std::int64_t local =
        local_it != positions_.end() ? local_it->second.netQuantity() : 0;
    const std::int64_t remote = broker_it != broker.end() ? broker_it->second : 0;
    if (local != remote) {
      out.push_back(PositionDiscrepancy{symbol, local, remote});
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
double Portfolio::cash() const {
  std::shared_lock lock(mutex_);
  return cash_;
}

double Portfolio::marginUsed() const {
  std::shared_lock lock(mutex_);
  return margin_used_;
}

std::int64_t Portfolio::longShares(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  return it != positions_.end() ? it->second.long_qty : 0;
}

std::int64_t Portfolio::shortShares(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  return it != positions_.end() ? it->second.short_qty : 0;
}

double Portfolio::totalRealizedGains() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& [symbol, gains] : realized_) {
    total += gains.long_gains + gains.short_gains;
  }
  return total;
}

PortfolioSnapshot Portfolio::snapshot() const {
  std::shared_lock lock(mutex_);
  return PortfolioSnapshot{cash_, margin_requirement_, margin_used_,
                           positions_, realized_};
}

nlohmann::json Portfolio::toJson() const {
  const PortfolioSnapshot s = snapshot();

  nlohmann::json positions = nlohmann::json::object();
  for (const auto& [symbol, p] : s.positions) {
    positions[symbol] = {
        {"long", p.long_qty},
        {"short", p.short_qty},
        {"long_cost_basis", p.long_cost_basis},
        {"short_cost_basis", p.short_cost_basis},
        {"short_margin_used", p.short_margin_used},
    };
  }

  nlohmann::json realized = nlohmann::json::object();
  for (const auto& [symbol, g] : s.realized_gains) {
    realized[symbol] = {{"long", g.long_gains}, {"short", g.short_gains}};
  }

  return {
      {"cash", s.cash},
      {"margin_requirement", s.margin_requirement},
      {"margin_used", s.margin_used},
      {"positions", positions},
      {"realized_gains", realized},
  };
}

// Caller holds a unique lock.
PortfolioPosition& Portfolio::leg(const std::string& symbol) {
  PortfolioPosition& pos = positions_[symbol];
  if (pos.symbol.empty()) {
    pos.symbol = symbol;
  }
  return pos;
}

}  // namespace tradegate
