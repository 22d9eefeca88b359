#pragma once

#include <cstdint>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// Position - broker-reported per-symbol holding
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a single holding as the broker sees it.
//
// @details
// Sign convention for quantity:
//   positive → long  (we own the instrument)
//   negative → short (we owe the instrument)
//   zero     → flat
//
// market_value is quantity × market_price as reported by the broker; it is
// signed the same way as quantity for short positions.
//
// Thread model:
//   Value type. Brokers return vectors of copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;            // Instrument identifier (e.g. "AAPL")
  std::int64_t quantity{0};      // Signed: +long, -short, 0=flat
  double avg_cost{0.0};          // Average entry price
  double market_value{0.0};      // quantity * market_price
  double unrealized_pnl{0.0};
  double market_price{0.0};
};

}  // namespace domain
}  // namespace tradegate
