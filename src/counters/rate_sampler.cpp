#include "counters/rate_sampler.hpp"

#include <cmath>
#include <utility>

#include "core/error.hpp"
#include "counters/instance_resolver.hpp"

namespace perf_sampler::counters {

RateSampler::~RateSampler() { close(); }

void RateSampler::open(CounterProvider& provider, const CounterSettings& settings) {
  close();
  open(open_counter_handle(provider, settings), true);
}

void RateSampler::open(std::unique_ptr<CounterHandle> handle, const bool prime) {
  close();
  if (handle == nullptr) {
    throw core::CounterError(core::errc::invalid_argument, "counter handle is null");
  }

  handle_ = std::move(handle);
  if (!prime) {
    return;
  }

  try {
    (void)value();
  } catch (...) {
    close();
    throw;
  }
}

float RateSampler::value() {
  if (handle_ == nullptr) {
    throw core::CounterError(core::errc::handle_closed, "sampler is not open");
  }

  const RawSample sample = handle_->next_sample();
  if (sample.system_frequency != 0) {
    const double elapsed_seconds =
        static_cast<double>(sample.timestamp - current_.timestamp) / static_cast<double>(sample.system_frequency);
    if (current_.is_empty() || std::fabs(elapsed_seconds) > kRotationThresholdSeconds) {
      previous_ = current_;
      current_ = sample;
      if (previous_.is_empty()) {
        previous_ = sample;
      }
    }
  } else {
    previous_ = current_;
    current_ = sample;
  }

  return calculate_delta(previous_, sample);
}

void RateSampler::close() noexcept {
  if (handle_ != nullptr) {
    handle_->close();
    handle_.reset();
  }
  previous_ = RawSample::empty();
  current_ = RawSample::empty();
}

bool RateSampler::is_open() const noexcept { return handle_ != nullptr; }

const RawSample& RateSampler::previous_sample() const noexcept { return previous_; }

const RawSample& RateSampler::current_sample() const noexcept { return current_; }

std::string RateSampler::instance_name(CounterProvider& provider, const std::string& category) {
  return resolve_process_instance(provider, category, current_process_id());
}

}  // namespace perf_sampler::counters
