#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace tp {

inline constexpr const char* kTimestampFormat = "%Y-%m-%d %H:%M:%S";

// Format an epoch-seconds timestamp using strftime.
inline std::string formatTimestamp(std::time_t epoch, const char* fmt = kTimestampFormat,
                                   bool utc = false) {
  std::tm tm;
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm);
  return buf;
}

inline std::string formatTimestamp(std::chrono::system_clock::time_point when,
                                   const char* fmt = kTimestampFormat, bool utc = false) {
  return formatTimestamp(std::chrono::system_clock::to_time_t(when), fmt, utc);
}

} // namespace tp
