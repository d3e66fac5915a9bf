#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "counters/raw_sample.hpp"

namespace perf_sampler::counters {

struct CounterPath {
  std::string category;
  std::string counter;
  std::string instance;
  // Empty means the local machine.
  std::string machine_name;
};

// Counter selection as configured by the host.
struct CounterSettings {
  std::string category;
  std::string counter;
  std::optional<std::string> instance;
  std::optional<std::string> machine_name;
};

// One open counter connection. Destroying a handle closes it.
class CounterHandle {
 public:
  virtual ~CounterHandle() = default;

  // Throws core::CounterError (error_kind::read) when the handle is closed
  // or the instance went away.
  virtual RawSample next_sample() = 0;

  virtual void close() noexcept = 0;

  [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

class CounterProvider {
 public:
  virtual ~CounterProvider() = default;

  // Throws core::CounterError (error_kind::configuration) when the counter
  // cannot be opened.
  virtual std::unique_ptr<CounterHandle> open(const CounterPath& path, bool read_only) = 0;

  virtual std::vector<std::string> instance_names(const std::string& category) = 0;
};

// Opens the handle described by settings. Local counters in the process
// category without an explicit instance are bound to the instance of process_id.
std::unique_ptr<CounterHandle> open_counter_handle(CounterProvider& provider, const CounterSettings& settings,
                                                   std::int64_t process_id);

std::unique_ptr<CounterHandle> open_counter_handle(CounterProvider& provider, const CounterSettings& settings);

}  // namespace perf_sampler::counters
