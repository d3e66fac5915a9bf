#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <vector>

#include "core/config.hpp"
#include "counters/counter_handle.hpp"
#include "model/reading_frame.hpp"
#include "render/counter_renderer.hpp"
#include "sinks/json_lines_sink.hpp"
#include "sinks/text_sink.hpp"

namespace perf_sampler::core {

struct PollerStats {
  std::size_t ticks_executed{0};
  std::size_t renders{0};
  std::size_t render_failures{0};
  std::size_t frames_published{0};
};

// Drives one renderer per configured counter on a fixed tick and publishes a
// frame per tick. A failing counter never stops the loop.
class Poller {
 public:
  Poller(HostConfig config, counters::CounterProvider& provider, std::ostream& out);
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  // Returns the number of counters that initialized.
  std::size_t initialize();

  // total_ticks == 0 runs until the process is stopped.
  PollerStats run_for_ticks(std::size_t total_ticks);

  void close() noexcept;

  [[nodiscard]] const model::reading_frame& last_frame() const noexcept;

 private:
  struct CounterRegistration {
    CounterConfig config;
    std::unique_ptr<render::CounterRenderer> renderer;
    bool active{false};
  };

  [[nodiscard]] bool should_render(std::uint64_t every_ticks) const noexcept;
  void collect_readings(PollerStats& stats);
  void publish_sinks(PollerStats& stats);

  std::chrono::milliseconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::uint64_t tick_count_{0};
  OutputFormat output_{OutputFormat::text};
  std::vector<CounterRegistration> registrations_{};
  model::reading_frame frame_{};

  sinks::TextSink text_sink_;
  sinks::JsonLinesSink json_sink_;
};

}  // namespace perf_sampler::core
