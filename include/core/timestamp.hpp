#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace interview_agent::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline double unix_timestamp_now_s() {
  return static_cast<double>(unix_timestamp_now_ns()) / 1'000'000'000.0;
}

// Local wall-clock time rendered with strftime, e.g. "%Y%m%d_%H%M%S".
inline std::string local_time_string(const char* format) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[64]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), format, &local);
  return std::string(buffer, written);
}

inline std::string iso8601_now() { return local_time_string("%Y-%m-%dT%H:%M:%S"); }

}  // namespace interview_agent::core
