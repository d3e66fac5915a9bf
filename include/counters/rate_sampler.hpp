#pragma once

#include <memory>
#include <string>

#include "counters/counter_handle.hpp"
#include "counters/raw_sample.hpp"

namespace perf_sampler::counters {

// Turns successive raw samples of one counter into a value.
//
// Time based counters should be read at most about once per second for a
// stable rate. Reference samples are therefore only rotated once more than
// kRotationThresholdSeconds elapsed since the last rotation; every call still
// computes against the newest raw reading.
//
// Not thread safe. One sampler is driven by one caller.
class RateSampler {
 public:
  static constexpr double kRotationThresholdSeconds = 0.5;

  RateSampler() = default;
  ~RateSampler();

  RateSampler(const RateSampler&) = delete;
  RateSampler& operator=(const RateSampler&) = delete;

  // Opens the counter (see open_counter_handle) and performs the warm-up read.
  void open(CounterProvider& provider, const CounterSettings& settings);

  // Takes ownership of an already open handle. prime performs the warm-up read.
  void open(std::unique_ptr<CounterHandle> handle, bool prime = true);

  float value();

  void close() noexcept;

  [[nodiscard]] bool is_open() const noexcept;

  [[nodiscard]] const RawSample& previous_sample() const noexcept;
  [[nodiscard]] const RawSample& current_sample() const noexcept;

  // Instance of category that belongs to this process, or "" when unknown.
  static std::string instance_name(CounterProvider& provider, const std::string& category);

 private:
  std::unique_ptr<CounterHandle> handle_{};
  RawSample previous_{};
  RawSample current_{};
};

}  // namespace perf_sampler::counters
