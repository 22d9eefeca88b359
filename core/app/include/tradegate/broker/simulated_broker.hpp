#pragma once

#include "tradegate/broker/i_broker.hpp"
#include "tradegate/concurrent/order_id_generator.hpp"
#include "tradegate/config/trade_config.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// SimulatedBroker - dry-run IBroker backed by a paper account
// -----------------------------------------------------------------------------
//
// @brief  Fills every accepted order immediately and in full with a modeled
//         slippage and commission, and books the fill into an in-memory
//         account so later snapshots reflect it.
//
// @details
// Fill model (deterministic):
//   market  = quote book price for the symbol
//   fill    = market × (1 + slippage) for BUY, market × (1 - slippage) for SELL
//   comm    = max(min_commission, commission_rate × quantity × fill)
//   status  = FILLED, filled_quantity = quantity (never partial)
//
// Market price lookup order:
//   1. a price pinned with updateQuote()
//   2. quote source broker, if one was given and it is connected; asked
//      afresh on every call
//   3. the last price the quote source returned, when the fetch fails
//   4. the price attached to the order (logged as a fallback)
// If none yields a price the order is REJECTED with a DataError message.
//
// Paper account:
//   cash starts at TradeConfig::paper_starting_cash. BUY debits
//   notional + commission, SELL credits notional - commission. Positions are
//   signed; selling more than held opens a short. Average cost follows the
//   increase / decrease / reversal rules (realized P&L on the closed part).
//
// Order ids come from an OrderIdGenerator ("SIM-000001", ...). Results are
// kept so getOrderStatus() and cancelOrder() can answer for them.
//
// Thread model:
//   Internal state is guarded by mutex_. The quote source is called with
//   the mutex released.
//
// Ownership:
//   Borrows the time provider. The quote source is either borrowed (raw
//   pointer, must outlive this broker) or owned (unique_ptr). An owned
//   quote source is connected and disconnected together with this broker;
//   failing to connect it only disables live quotes.
// -----------------------------------------------------------------------------
class SimulatedBroker final : public IBroker {
 public:
  SimulatedBroker(const TradeConfig& config, const ITimeProvider& clock,
                  IBroker* quote_source = nullptr);
  SimulatedBroker(const TradeConfig& config, const ITimeProvider& clock,
                  std::unique_ptr<IBroker> quote_source);

  SimulatedBroker(const SimulatedBroker&) = delete;
  SimulatedBroker& operator=(const SimulatedBroker&) = delete;
  SimulatedBroker(SimulatedBroker&&) = delete;
  SimulatedBroker& operator=(SimulatedBroker&&) = delete;

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

  std::string name() const override { return "simulated"; }

  // Pins the price for `symbol`; it takes precedence over the quote source.
  void updateQuote(const std::string& symbol, double price);

  // Seeds a holding without touching cash (tests, replay setup).
  void seedPosition(const std::string& symbol, std::int64_t quantity,
                    double avg_cost);

  double realizedPnl() const;

 private:
  struct Holding {
    std::int64_t quantity{0};
    double avg_cost{0.0};
  };

  std::optional<double> lookupPrice(const std::string& symbol);
  // Requires mutex_ held.
  void bookFill(domain::Side side, const std::string& symbol,
                std::int64_t quantity, double price, double commission);
  double lastPrice(const std::string& symbol, const Holding& h) const;

  const TradeConfig config_;
  const ITimeProvider& clock_;
  std::unique_ptr<IBroker> owned_quote_source_;
  IBroker* quote_source_;

  OrderIdGenerator id_gen_{"SIM"};
  std::atomic<bool> connected_{false};

  mutable std::mutex mutex_;
  double cash_;
  double realized_pnl_{0.0};
  std::map<std::string, Holding> holdings_;
  std::unordered_map<std::string, double> pinned_quotes_;
  // Last price fetched from the quote source.
  std::unordered_map<std::string, double> quotes_;
  std::unordered_map<std::string, domain::TradeResult> orders_;
};

}  // namespace tradegate
