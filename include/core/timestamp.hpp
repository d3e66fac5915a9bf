#pragma once

#include <chrono>
#include <cstdint>

namespace perf_sampler::core {

// Counter timestamps are steady-clock nanoseconds.
inline constexpr std::int64_t kMonotonicFrequency = 1'000'000'000;

inline std::int64_t monotonic_ticks_now() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

}  // namespace perf_sampler::core
