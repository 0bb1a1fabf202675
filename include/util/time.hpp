#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

inline std::string FormatLocal(std::chrono::system_clock::time_point tp,
                               const char *fmt) {
  std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  return FormatTm(LocalTime(tt), fmt);
}

inline std::string NowLocalFormatted(const char *fmt) {
  return FormatLocal(std::chrono::system_clock::now(), fmt);
}

// YYYYMMDD_HHMMSS, used in audit file names
inline std::string TimestampForFile() {
  return NowLocalFormatted("%Y%m%d_%H%M%S");
}

// HH:MM:SS for console records
inline std::string ClockTime() { return NowLocalFormatted("%H:%M:%S"); }

// 2024-01-31T12:00:00 for session summaries
inline std::string IsoTime(std::chrono::system_clock::time_point tp) {
  return FormatLocal(tp, "%Y-%m-%dT%H:%M:%S");
}

} // namespace timeutil
