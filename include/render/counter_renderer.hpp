#pragma once

#include <locale>
#include <string>

#include "counters/counter_handle.hpp"
#include "counters/rate_sampler.hpp"

namespace perf_sampler::render {

struct FormatOptions {
  int precision{-1};
  std::string locale{};
};

// Formats value with the given locale. precision < 0 prints the shortest
// fixed-notation digits that read back as the same float.
std::string format_value(float value, int precision, const std::locale& locale);

// Throws core::CounterError (invalid_argument) for an unknown locale name.
std::locale make_locale(const std::string& name);

// Host-facing wrapper around one RateSampler: initialize once, render on
// every poll, close when the host shuts down. Formatting stays here so the
// sampler itself never depends on a locale.
class CounterRenderer {
 public:
  CounterRenderer(counters::CounterProvider& provider, counters::CounterSettings settings, FormatOptions format = {});
  ~CounterRenderer();

  CounterRenderer(const CounterRenderer&) = delete;
  CounterRenderer& operator=(const CounterRenderer&) = delete;

  // Opens the counter and performs the warm-up read. Configuration errors
  // propagate; the renderer stays closed.
  void initialize();

  void close() noexcept;

  [[nodiscard]] bool initialized() const noexcept;

  float render_value();

  std::string render();

  [[nodiscard]] std::string format(float value) const;

  [[nodiscard]] const counters::CounterSettings& settings() const noexcept;

 private:
  counters::CounterProvider& provider_;
  counters::CounterSettings settings_;
  FormatOptions format_;
  std::locale locale_{std::locale::classic()};
  counters::RateSampler sampler_{};
};

}  // namespace perf_sampler::render
