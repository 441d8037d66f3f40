#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace copytrader {

using Timestamp = std::chrono::system_clock::time_point;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// Convert between epoch milliseconds (what ITimeProvider and the venue use)
// and std::chrono time points.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_utc(ms, fmt)
// -------------------------------------------------------------------------
// @brief  strftime-formats an epoch-millisecond time in UTC.
//
// @details
// Used for the daily JSON-lines file names ("%Y%m%d") and the HH:MM:SS
// column of the recent-trades report. gmtime_r keeps this reentrant.
// -------------------------------------------------------------------------
inline std::string format_utc(std::int64_t ms, const char* fmt) {
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);

  char buffer[64];
  std::size_t n = std::strftime(buffer, sizeof(buffer), fmt, &tm);
  return std::string(buffer, n);
}

}  // namespace copytrader
