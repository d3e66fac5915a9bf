#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "counters/counter_handle.hpp"

namespace perf_sampler::counters {

inline constexpr const char* kProcessCategory = "Process";
inline constexpr const char* kProcessIdCounter = "ID Process";

[[nodiscard]] bool is_process_category(std::string_view category) noexcept;

[[nodiscard]] std::int64_t current_process_id() noexcept;

// Finds the instance of category whose "ID Process" counter reports
// process_id. Several processes can share an executable name, so the name
// alone does not identify the instance.
//
// Returns an empty string when nothing matches or when reading an instance id
// fails with a recoverable error. Fatal errors are rethrown.
std::string resolve_process_instance(CounterProvider& provider, const std::string& category,
                                     std::int64_t process_id);

}  // namespace perf_sampler::counters
