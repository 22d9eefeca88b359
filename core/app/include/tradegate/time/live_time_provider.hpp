#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock implementation used by live and dry-run
// sessions started from main().
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace tradegate
