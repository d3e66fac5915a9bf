#include "counters/raw_sample.hpp"

namespace perf_sampler::counters {
namespace {

std::int64_t cumulative_delta(const std::int64_t previous, const std::int64_t current) noexcept {
  return current >= previous ? (current - previous) : 0;
}

}  // namespace

bool is_delta_type(const CounterType type) noexcept {
  switch (type) {
    case CounterType::counter_delta:
    case CounterType::rate_per_second:
    case CounterType::timer:
    case CounterType::sample_fraction:
    case CounterType::average_count:
      return true;
    case CounterType::number_of_items:
    case CounterType::raw_fraction:
    case CounterType::elapsed_time:
      return false;
  }
  return false;
}

float calculate_delta(const RawSample& previous, const RawSample& current) noexcept {
  switch (current.counter_type) {
    case CounterType::number_of_items:
      return static_cast<float>(current.raw_value);

    case CounterType::raw_fraction:
      if (current.base_value == 0) {
        return 0.0F;
      }
      return static_cast<float>(100.0 * static_cast<double>(current.raw_value) /
                                static_cast<double>(current.base_value));

    case CounterType::elapsed_time:
      if (current.system_frequency == 0) {
        return 0.0F;
      }
      return static_cast<float>(static_cast<double>(current.timestamp - current.raw_value) /
                                static_cast<double>(current.system_frequency));

    default:
      break;
  }

  if (previous.is_empty()) {
    return 0.0F;
  }

  const std::int64_t value_delta = cumulative_delta(previous.raw_value, current.raw_value);
  const std::int64_t time_delta = current.timestamp - previous.timestamp;
  const std::int64_t base_delta = cumulative_delta(previous.base_value, current.base_value);

  switch (current.counter_type) {
    case CounterType::counter_delta:
      return static_cast<float>(value_delta);

    case CounterType::rate_per_second: {
      if (time_delta <= 0 || current.system_frequency == 0) {
        return 0.0F;
      }
      const double seconds = static_cast<double>(time_delta) / static_cast<double>(current.system_frequency);
      return static_cast<float>(static_cast<double>(value_delta) / seconds);
    }

    case CounterType::timer:
      if (time_delta <= 0) {
        return 0.0F;
      }
      return static_cast<float>(100.0 * static_cast<double>(value_delta) / static_cast<double>(time_delta));

    case CounterType::sample_fraction:
      if (base_delta == 0) {
        return 0.0F;
      }
      return static_cast<float>(100.0 * static_cast<double>(value_delta) / static_cast<double>(base_delta));

    case CounterType::average_count:
      if (base_delta == 0) {
        return 0.0F;
      }
      return static_cast<float>(static_cast<double>(value_delta) / static_cast<double>(base_delta));

    default:
      return 0.0F;
  }
}

const char* to_string(const CounterType type) noexcept {
  switch (type) {
    case CounterType::number_of_items:
      return "number_of_items";
    case CounterType::counter_delta:
      return "counter_delta";
    case CounterType::rate_per_second:
      return "rate_per_second";
    case CounterType::timer:
      return "timer";
    case CounterType::raw_fraction:
      return "raw_fraction";
    case CounterType::sample_fraction:
      return "sample_fraction";
    case CounterType::average_count:
      return "average_count";
    case CounterType::elapsed_time:
      return "elapsed_time";
  }
  return "unknown";
}

}  // namespace perf_sampler::counters
