#pragma once

#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// AccountInfo - point-in-time account snapshot
// -----------------------------------------------------------------------------
//
// Monetary fields are non-negative except the pnl fields. The core never
// mutates a snapshot; it re-fetches from the broker instead. total_assets is
// the net liquidation value used for concentration checks.
// -----------------------------------------------------------------------------
struct AccountInfo {
  std::string account_id;
  double total_assets{0.0};
  double cash{0.0};
  double market_value{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  double buying_power{0.0};
  std::string currency{"USD"};
};

}  // namespace domain
}  // namespace tradegate
