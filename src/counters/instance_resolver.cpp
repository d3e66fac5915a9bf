#include "counters/instance_resolver.hpp"

#include <exception>

#include <unistd.h>

#include "core/error.hpp"
#include "core/log.hpp"
#include "core/strings.hpp"

namespace perf_sampler::counters {
namespace {

constexpr const char* kLogTag = "resolver";

}  // namespace

bool is_process_category(const std::string_view category) noexcept {
  return core::iequals(category, kProcessCategory);
}

std::int64_t current_process_id() noexcept { return static_cast<std::int64_t>(::getpid()); }

std::string resolve_process_instance(CounterProvider& provider, const std::string& category,
                                     const std::int64_t process_id) {
  try {
    for (const std::string& instance : provider.instance_names(category)) {
      std::int64_t instance_id = 0;
      {
        const auto id_handle = provider.open(CounterPath{category, kProcessIdCounter, instance, {}}, true);
        instance_id = id_handle->next_sample().raw_value;
        id_handle->close();
      }

      if (instance_id == process_id) {
        return instance;
      }
    }

    core::log(core::LogLevel::debug, kLogTag,
              "failed to auto detect current process instance. process_id=" + std::to_string(process_id));
  } catch (...) {
    const std::exception_ptr error = std::current_exception();
    if (core::classify_exception(error) == core::ErrorSeverity::fatal) {
      throw;
    }
    core::log(core::LogLevel::warn, kLogTag,
              "failed to auto detect current process instance: " + core::describe_exception(error));
  }
  return {};
}

}  // namespace perf_sampler::counters
