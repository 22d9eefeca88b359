#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// ITimeProvider - injectable source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the wall clock so the risk manager's trading-day logic,
//         order timestamps and failure logs are deterministic under test.
//
// @details
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → value set explicitly via advance_time().
//
// Components receive `const ITimeProvider&` and never call system_clock
// directly. Trading days are UTC calendar days derived from now_ms() (see
// trading_day() in time_utils.hpp).
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds (1970-01-01 00:00:00 UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradegate
