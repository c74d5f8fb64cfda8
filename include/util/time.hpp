#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Formats the current local time with a strftime-like format string.
inline std::string NowLocalFormatted(const char *fmt) {
  const std::time_t tt =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Compact timestamp for transcript file names: YYYYMMDD_HHMMSS
inline std::string TimestampForFile() {
  return NowLocalFormatted("%Y%m%d_%H%M%S");
}

// Wall time of a run for summary lines, e.g. "1.234s"
inline std::string FormatElapsed(std::chrono::steady_clock::duration d) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  std::ostringstream oss;
  oss << ms / 1000 << '.' << std::setw(3) << std::setfill('0') << ms % 1000
      << 's';
  return oss.str();
}

} // namespace timeutil
