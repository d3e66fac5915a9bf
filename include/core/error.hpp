#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <system_error>

namespace perf_sampler::core {
enum class errc : std::uint32_t;
enum class error_kind : std::uint32_t;
}  // namespace perf_sampler::core

namespace std {
template <>
struct is_error_code_enum<perf_sampler::core::errc> : std::true_type {};
template <>
struct is_error_condition_enum<perf_sampler::core::error_kind> : std::true_type {};
}  // namespace std

namespace perf_sampler::core {

enum class errc : std::uint32_t {
  category_not_found = 1,
  counter_not_found,
  instance_not_found,
  single_instance_category,
  access_denied,
  machine_unreachable,
  invalid_argument,
  handle_closed,
  instance_exited,
  read_failed,
  parse_error,
};

// Configuration errors are fatal to the sampler that raised them.
// Read errors propagate out of a single value() call.
enum class error_kind : std::uint32_t {
  configuration = 1,
  read,
};

enum class ErrorSeverity : std::uint8_t {
  recoverable = 0,
  fatal = 1,
};

struct CounterError : std::system_error {
  using system_error::system_error;
};

std::error_code make_error_code(errc code) noexcept;
std::error_condition make_error_condition(error_kind kind) noexcept;

const std::error_category& counter_category() noexcept;

// Rethrow policy for code that must survive a failing operation:
// fatal exceptions mean the process itself is in trouble and must be rethrown.
ErrorSeverity classify_exception(const std::exception_ptr& error) noexcept;

std::string describe_exception(const std::exception_ptr& error);

}  // namespace perf_sampler::core
