#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set by the caller.
//
// @details
// Used by tests to move the risk manager across a trading-day boundary
// without waiting for midnight, and to give dry-run fills reproducible
// timestamps. The value is held in a std::atomic so a test thread may
// advance the clock while the executor reads it.
//
// Monotonicity is not enforced; setting an earlier time is allowed.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override { return current_time_ms_.load(); }

  // Sets the clock to an absolute epoch-millisecond value.
  void advance_time(std::int64_t new_time_ms) {
    current_time_ms_.store(new_time_ms);
  }

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms) {
    current_time_ms_.fetch_add(delta_ms);
  }

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradegate
