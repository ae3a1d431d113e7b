#pragma once

#include <chrono>
#include <cstdint>

namespace tuxmood::core {

using Clock = std::chrono::steady_clock;

inline std::uint64_t to_ns(const Clock::time_point point) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(point.time_since_epoch()).count());
}

inline std::uint64_t monotonic_timestamp_now_ns() { return to_ns(Clock::now()); }

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

template <typename Duration>
inline float to_ms_float(const Duration duration) {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(duration).count();
}

}  // namespace tuxmood::core
