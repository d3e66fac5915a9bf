#include "core/poller.hpp"

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "core/error.hpp"
#include "core/log.hpp"
#include "core/timestamp.hpp"

namespace perf_sampler::core {
namespace {

constexpr const char* kLogTag = "poller";

std::string describe_counter(const CounterConfig& config) {
  std::string out = config.name + " (" + config.settings.category + "\\" + config.settings.counter;
  if (config.settings.instance.has_value() && !config.settings.instance->empty()) {
    out += "(" + *config.settings.instance + ")";
  }
  if (config.settings.machine_name.has_value()) {
    out += " on " + *config.settings.machine_name;
  }
  return out + ")";
}

}  // namespace

Poller::Poller(HostConfig config, counters::CounterProvider& provider, std::ostream& out)
    : tick_interval_(config.tick_interval), output_(config.output), text_sink_(out), json_sink_(out) {
  registrations_.reserve(config.counters.size());
  for (CounterConfig& counter : config.counters) {
    auto renderer = std::make_unique<render::CounterRenderer>(
        provider, counter.settings, render::FormatOptions{counter.precision, counter.locale});
    registrations_.push_back(CounterRegistration{std::move(counter), std::move(renderer), false});
  }
}

Poller::~Poller() { close(); }

std::size_t Poller::initialize() {
  std::size_t active = 0;
  for (CounterRegistration& registration : registrations_) {
    try {
      registration.renderer->initialize();
      registration.active = true;
      ++active;
      log(LogLevel::info, kLogTag, "opened " + describe_counter(registration.config));
    } catch (...) {
      const std::exception_ptr error = std::current_exception();
      if (classify_exception(error) == ErrorSeverity::fatal) {
        throw;
      }
      registration.active = false;
      log(LogLevel::error, kLogTag,
          "failed to open " + describe_counter(registration.config) + ": " + describe_exception(error));
    }
  }
  return active;
}

PollerStats Poller::run_for_ticks(const std::size_t total_ticks) {
  PollerStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    collect_readings(stats);
    publish_sinks(stats);

    ++stats.ticks_executed;
    ++tick_count_;

    next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void Poller::close() noexcept {
  for (CounterRegistration& registration : registrations_) {
    registration.renderer->close();
    registration.active = false;
  }
}

const model::reading_frame& Poller::last_frame() const noexcept { return frame_; }

bool Poller::should_render(const std::uint64_t every_ticks) const noexcept {
  if (every_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_ticks) == 0;
}

void Poller::collect_readings(PollerStats& stats) {
  frame_.timestamp_ns = unix_timestamp_now_ns();
  frame_.tick = tick_count_;
  frame_.readings.clear();

  for (CounterRegistration& registration : registrations_) {
    if (!registration.active || !should_render(registration.config.every_ticks)) {
      continue;
    }

    const CounterConfig& config = registration.config;
    model::counter_reading reading{};
    reading.name = config.name;
    reading.category = config.settings.category;
    reading.counter = config.settings.counter;
    reading.instance = config.settings.instance.value_or("");

    try {
      const float value = registration.renderer->render_value();
      reading.formatted = registration.renderer->format(value);
      reading.value = value;
      ++stats.renders;
    } catch (...) {
      const std::exception_ptr error = std::current_exception();
      if (classify_exception(error) == ErrorSeverity::fatal) {
        throw;
      }
      ++stats.render_failures;
      reading.error = describe_exception(error);
      log(LogLevel::warn, kLogTag, "render failed for " + describe_counter(config) + ": " + reading.error);
    }

    frame_.readings.push_back(std::move(reading));
  }
}

void Poller::publish_sinks(PollerStats& stats) {
  if (output_ == OutputFormat::json) {
    json_sink_.publish(frame_);
  } else {
    text_sink_.publish(frame_);
  }
  ++stats.frames_published;
}

}  // namespace perf_sampler::core
