#pragma once

#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus - lifecycle state of a submitted order
// -----------------------------------------------------------------------------
//
// Terminal states: Filled, Cancelled, Rejected, Failed.
// Rejected is used when the broker refuses the order on its own rules;
// Failed is used for transport or internal errors (including timeouts).
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Built locally, not yet sent
  Submitted,        // Acknowledged by the broker, no fill yet
  Filled,           // Fully filled
  PartiallyFilled,  // Some quantity filled, remainder still open
  Cancelled,        // Cancelled by request
  Rejected,         // Refused by the broker
  Failed,           // Transport/internal failure
};

inline const char* orderStatusToString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending:         return "PENDING";
    case OrderStatus::Submitted:       return "SUBMITTED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Cancelled:       return "CANCELLED";
    case OrderStatus::Rejected:        return "REJECTED";
    case OrderStatus::Failed:          return "FAILED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// orderStatusFromGateway
// -----------------------------------------------------------------------------
// @brief  Maps a broker gateway status string onto OrderStatus.
//
// @details
//   FILLED_ALL                       → Filled
//   FILLED_PART                      → PartiallyFilled
//   CANCELLED_ALL / CANCELLED_PART   → Cancelled
//   FAILED / DISABLED                → Failed
//   anything else (SUBMITTED, WAITING_SUBMIT, ...) → Submitted
// -----------------------------------------------------------------------------
inline OrderStatus orderStatusFromGateway(const std::string& status) {
  if (status == "FILLED_ALL") return OrderStatus::Filled;
  if (status == "FILLED_PART") return OrderStatus::PartiallyFilled;
  if (status == "CANCELLED_ALL" || status == "CANCELLED_PART") {
    return OrderStatus::Cancelled;
  }
  if (status == "FAILED" || status == "DISABLED") return OrderStatus::Failed;
  return OrderStatus::Submitted;
}

inline bool isTerminal(OrderStatus s) {
  return s == OrderStatus::Filled || s == OrderStatus::Cancelled ||
         s == OrderStatus::Rejected || s == OrderStatus::Failed;
}

}  // namespace domain
}  // namespace tradegate
