#include "tradegate/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace tradegate {

namespace {

// gmtime_r is POSIX; the engine targets Linux only.
std::tm utc_tm(std::int64_t seconds) {
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

}  // namespace

std::string format_iso8601(std::int64_t ms) {
  const std::int64_t day = trading_day(ms);
  const std::int64_t ms_of_day = ms - day * kMillisPerDay;
  const std::tm tm = utc_tm(day * 86'400 + ms_of_day / 1000);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(ms_of_day % 1000));
  return buf;
}

std::string format_date(std::int64_t day_index) {
  const std::tm tm = utc_tm(day_index * 86'400);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

}  // namespace tradegate
