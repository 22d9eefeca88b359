#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace tradegate {

// -----------------------------------------------------------------------------
// OrderIdGenerator - monotonically increasing local order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids for orders that never reach a real broker
//         (dry-run fills), formatted as "<prefix>-<6-digit counter>".
//
// @details
// Counter starts at 1 and is bumped with fetch_add(relaxed); uniqueness is
// the only requirement, there is no ordering relationship with other data.
// Owned as a value member by SimulatedBroker; not a singleton.
//
// Thread model:
//   next_id() / next() are safe to call from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::string prefix = "SIM")
      : prefix_(std::move(prefix)) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // e.g. "SIM-000042"
  std::string next() {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "-%06llu",
                  static_cast<unsigned long long>(next_id()));
    return prefix_ + buf;
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tradegate
