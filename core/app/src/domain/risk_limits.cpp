#include "tradegate/domain/risk_limits.hpp"

#include <iomanip>
#include <sstream>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimit::check: utilization tiers
// -----------------------------------------------------------------------------
RiskLimit::Check RiskLimit::check(double additional) const {
  Check result;
  if (!active()) {
    result.message = name + " check disabled";
    return result;
  }

  const double total = current_value + additional;
  result.utilization = total / max_value;

  std::ostringstream msg;
  msg << std::fixed << std::setprecision(2);

  if (result.utilization >= 1.0) {
    result.ok = false;
    result.level = RiskLevel::Critical;
    msg << name << " limit exceeded: " << total << " >= " << max_value;
  } else {
    msg.precision(1);
    if (result.utilization >= warning_threshold) {
      result.level = RiskLevel::High;
      msg << name << " approaching limit: ";
    } else if (result.utilization >= 0.5) {
      result.level = RiskLevel::Medium;
      msg << name << " moderate usage: ";
    } else {
      msg << name << " within limits: ";
    }
    msg << result.utilization * 100.0 << "% used";
  }

  result.message = msg.str();
  return result;
}

}  // namespace domain
}  // namespace tradegate
