#include "counters/counter_handle.hpp"

#include "core/error.hpp"
#include "counters/instance_resolver.hpp"

namespace perf_sampler::counters {

std::unique_ptr<CounterHandle> open_counter_handle(CounterProvider& provider, const CounterSettings& settings,
                                                   const std::int64_t process_id) {
  if (settings.category.empty()) {
    throw core::CounterError(core::errc::invalid_argument, "counter category is required");
  }
  if (settings.counter.empty()) {
    throw core::CounterError(core::errc::invalid_argument, "counter name is required");
  }

  if (settings.machine_name.has_value()) {
    return provider.open(
        CounterPath{settings.category, settings.counter, settings.instance.value_or(""), *settings.machine_name},
        true);
  }

  std::string instance = settings.instance.value_or("");
  if (instance.empty() && is_process_category(settings.category)) {
    instance = resolve_process_instance(provider, settings.category, process_id);
  }

  return provider.open(CounterPath{settings.category, settings.counter, instance, {}}, true);
}

std::unique_ptr<CounterHandle> open_counter_handle(CounterProvider& provider, const CounterSettings& settings) {
  return open_counter_handle(provider, settings, current_process_id());
}

}  // namespace perf_sampler::counters
