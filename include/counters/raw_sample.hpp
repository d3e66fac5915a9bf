#pragma once

#include <cstdint>

namespace perf_sampler::counters {

enum class CounterType : std::uint8_t {
  number_of_items = 0,
  counter_delta,
  rate_per_second,
  timer,
  raw_fraction,
  sample_fraction,
  average_count,
  elapsed_time,
};

// One reading of a counter. The all-zero sample is the "no sample yet" sentinel.
struct RawSample {
  std::int64_t timestamp{0};
  std::int64_t raw_value{0};
  std::int64_t base_value{0};
  // Timestamp ticks per second; 0 for counters that are not time based.
  std::int64_t system_frequency{0};
  CounterType counter_type{CounterType::number_of_items};

  static constexpr RawSample empty() noexcept { return RawSample{}; }

  [[nodiscard]] constexpr bool is_empty() const noexcept {
    return timestamp == 0 && raw_value == 0 && base_value == 0 && system_frequency == 0 &&
           counter_type == CounterType::number_of_items;
  }

  bool operator==(const RawSample&) const = default;
};

// True when the value depends on a previous sample.
[[nodiscard]] bool is_delta_type(CounterType type) noexcept;

// Standard two-sample formula. Zero denominators, negative cumulative deltas
// and delta types measured against the empty sample all yield 0.
[[nodiscard]] float calculate_delta(const RawSample& previous, const RawSample& current) noexcept;

const char* to_string(CounterType type) noexcept;

}  // namespace perf_sampler::counters
