#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace tradegate {

using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMillisPerDay = 86'400'000;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// Stateless helpers bridging ITimeProvider's int64 milliseconds and the
// representations used in reports (ISO-8601 strings) and the risk manager
// (UTC trading-day index).
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// trading_day
// -------------------------------------------------------------------------
// @brief  UTC day index (days since epoch) for an epoch-ms timestamp.
//
// @details
// Floor division, so timestamps before the epoch map to negative days
// instead of collapsing onto day 0.
// -------------------------------------------------------------------------
inline std::int64_t trading_day(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601(std::int64_t ms);

// "YYYY-MM-DD" for a trading_day() index.
std::string format_date(std::int64_t day_index);

}  // namespace tradegate
