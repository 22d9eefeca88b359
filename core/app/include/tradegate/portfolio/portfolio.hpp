#pragma once

#include "tradegate/domain/position.hpp"
#include "tradegate/domain/trading_decision.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradegate {

// Long and short legs of one symbol in the local mirror.
struct PortfolioPosition {
  std::string symbol;
  std::int64_t long_qty{0};
  std::int64_t short_qty{0};
  double long_cost_basis{0.0};   // average entry price of the long leg
  double short_cost_basis{0.0};  // average entry price of the short leg
  double short_margin_used{0.0};

  std::int64_t netQuantity() const { return long_qty - short_qty; }
};

struct RealizedGains {
  double long_gains{0.0};
  double short_gains{0.0};
};

struct PortfolioSnapshot {
  double cash{0.0};
  double margin_requirement{0.0};
  double margin_used{0.0};
  std::map<std::string, PortfolioPosition> positions;
  std::map<std::string, RealizedGains> realized_gains;
};

// Effect of applying one fill to the mirror.
struct FillEffect {
  std::int64_t applied_qty{0};
  double realized_pnl{0.0};
};

// Local vs broker quantity mismatch found by reconcile().
struct PositionDiscrepancy {
  std::string symbol;
  std::int64_t local_qty{0};
  std::int64_t broker_qty{0};
};

// -----------------------------------------------------------------------------
// Portfolio - decision-facing mirror of the broker account
// -----------------------------------------------------------------------------
//
// @brief  Cash, long/short legs with cost bases, short margin and realized
//         gains, kept in step with what was actually executed.
//
// @details
// The trade executor applies each successful fill exactly once with the
// executed quantity and fill price:
//
//   buy   → long_qty += q, weighted long cost basis, cash -= q × p
//   sell  → long_qty -= q (capped at holding), realizes (p - basis) × q,
//           cash += q × p
//   short → short_qty += q, weighted short cost basis, cash += proceeds,
//           margin_requirement × proceeds moved from cash into margin
//   cover → short_qty -= q (capped at holding), realizes (basis - p) × q,
//           releases the proportional share of short margin back to cash,
//           cash -= q × p
//
// Closing more than is held only applies up to the holding; applied_qty in
// the returned FillEffect reports what was booked.
//
// Thread model:
//   std::shared_mutex: snapshot/query calls take a shared lock, fills and
//   hydration take a unique lock.
//
// Ownership:
//   Owned by the caller (TradingSession); the executor receives it by
//   reference per execute() call.
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  explicit Portfolio(double cash, double margin_requirement = 0.5);

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;
  Portfolio(Portfolio&&) = delete;
  Portfolio& operator=(Portfolio&&) = delete;

  // Dispatches on action; Hold is a no-op.
  FillEffect applyFill(domain::TradeAction action, const std::string& symbol,
                       std::int64_t quantity, double price);

  FillEffect applyLongBuy(const std::string& symbol, std::int64_t quantity,
                          double price);
  FillEffect applyLongSell(const std::string& symbol, std::int64_t quantity,
                           double price);
  FillEffect applyShortOpen(const std::string& symbol, std::int64_t quantity,
                            double price);
  FillEffect applyShortCover(const std::string& symbol, std::int64_t quantity,
                             double price);

  void chargeCommission(double amount);

  // -------------------------------------------------------------------------
  // hydrate(positions, cash)
  // -------------------------------------------------------------------------
  // @brief  Replaces the position legs with broker-reported holdings.
  //
  // @details
  // Positive broker quantity → long leg at avg_cost; negative → short leg at
  // avg_cost with margin_requirement × notional recorded as margin. Realized
  // gains are kept. When `cash` is given it replaces the local cash.
  // -------------------------------------------------------------------------
  void hydrate(const std::vector<domain::Position>& positions,
               std::optional<double> cash = std::nullopt);

  // Symbols whose net local quantity differs from the broker's.
  std::vector<PositionDiscrepancy> reconcile(
      const std::vector<domain::Position>& broker_positions) const;

  double cash() const;
  double marginUsed() const;
  std::int64_t longShares(const std::string& symbol) const;
  std::int64_t shortShares(const std::string& symbol) const;
  double totalRealizedGains() const;

  PortfolioSnapshot snapshot() const;
  nlohmann::json toJson() const;

 private:
  PortfolioPosition& leg(const std::string& symbol);

  const double margin_requirement_;

  mutable std::shared_mutex mutex_;
  double cash_;
  double margin_used_{0.0};
  std::map<std::string, PortfolioPosition> positions_;
  std::map<std::string, RealizedGains> realized_;
};

}  // namespace tradegate
