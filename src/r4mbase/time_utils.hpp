#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace r4mw4tch::util {

inline uint64_t now_epoch_ms() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline std::string format_timestamp_local_ms(uint64_t ms_since_epoch, const char* format = "%Y-%m-%d %H:%M:%S") {
  auto duration = std::chrono::milliseconds(ms_since_epoch);
  auto tp = std::chrono::system_clock::time_point(duration);
  auto time_t = std::chrono::system_clock::to_time_t(tp);

  std::tm local_tm{};
#if defined(_WIN32)
  localtime_s(&local_tm, &time_t);
#else
  localtime_r(&time_t, &local_tm);
#endif

  std::stringstream ss;
  ss << std::put_time(&local_tm, format);
  return ss.str();
}

// compact form used for file name suffixes
inline std::string format_timestamp_suffix(uint64_t ms_since_epoch) {
  return format_timestamp_local_ms(ms_since_epoch, "%Y%m%d_%H%M%S");
}

} // namespace r4mw4tch::util
