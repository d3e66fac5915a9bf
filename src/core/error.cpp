#include "core/error.hpp"

#include <new>

namespace perf_sampler::core {
namespace {

struct counter_category_t : std::error_category {
  const char* name() const noexcept override;
  std::string message(int ev) const override;
  std::error_condition default_error_condition(int ev) const noexcept override;
};

struct error_kind_category_t : std::error_category {
  const char* name() const noexcept override;
  std::string message(int ev) const override;
  bool equivalent(const std::error_code& code, int condition) const noexcept override;
};

const counter_category_t counter_category_v;
const error_kind_category_t error_kind_category_v;

const char* counter_category_t::name() const noexcept { return "perf-sampler"; }

std::string counter_category_t::message(const int ev) const {
  switch (static_cast<errc>(ev)) {
    case errc::category_not_found:
      return "counter category does not exist";
    case errc::counter_not_found:
      return "counter does not exist in category";
    case errc::instance_not_found:
      return "counter instance does not exist";
    case errc::single_instance_category:
      return "category is single-instance; instance name is not valid";
    case errc::access_denied:
      return "access to the counter was denied";
    case errc::machine_unreachable:
      return "counter machine is not reachable";
    case errc::invalid_argument:
      return "invalid counter argument";
    case errc::handle_closed:
      return "counter handle is closed";
    case errc::instance_exited:
      return "counter instance no longer exists";
    case errc::read_failed:
      return "failed reading counter";
    case errc::parse_error:
      return "unexpected counter source format";
  }
  return "(unrecognized perf-sampler error code)";
}

std::error_condition counter_category_t::default_error_condition(const int ev) const noexcept {
  switch (static_cast<errc>(ev)) {
    case errc::category_not_found:
    case errc::counter_not_found:
    case errc::instance_not_found:
    case errc::single_instance_category:
    case errc::access_denied:
    case errc::machine_unreachable:
    case errc::invalid_argument:
      return error_kind::configuration;
    case errc::handle_closed:
    case errc::instance_exited:
    case errc::read_failed:
    case errc::parse_error:
      return error_kind::read;
  }
  return std::error_condition(ev, *this);
}

const char* error_kind_category_t::name() const noexcept { return "error-kind"; }

std::string error_kind_category_t::message(const int ev) const {
  switch (static_cast<error_kind>(ev)) {
    case error_kind::configuration:
      return "counter configuration error";
    case error_kind::read:
      return "counter read error";
  }
  return "(unrecognized error kind)";
}

bool error_kind_category_t::equivalent(const std::error_code& code, const int condition) const noexcept {
  if (code.category() == counter_category()) {
    return code.category().default_error_condition(code.value()) ==
           std::error_condition(condition, *this);
  }
  // Plain OS failures while opening are configuration problems.
  if (code.category() == std::system_category() || code.category() == std::generic_category()) {
    return static_cast<error_kind>(condition) == error_kind::configuration;
  }
  return false;
}

}  // namespace

std::error_code make_error_code(const errc code) noexcept {
  return std::error_code{static_cast<int>(code), counter_category_v};
}

std::error_condition make_error_condition(const error_kind kind) noexcept {
  return std::error_condition{static_cast<int>(kind), error_kind_category_v};
}

const std::error_category& counter_category() noexcept { return counter_category_v; }

ErrorSeverity classify_exception(const std::exception_ptr& error) noexcept {
  if (!error) {
    return ErrorSeverity::recoverable;
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::bad_alloc&) {
    return ErrorSeverity::fatal;
  } catch (const std::bad_exception&) {
    return ErrorSeverity::fatal;
  } catch (const std::exception&) {
    return ErrorSeverity::recoverable;
  } catch (...) {
    return ErrorSeverity::fatal;
  }
}

std::string describe_exception(const std::exception_ptr& error) {
  if (!error) {
    return "no exception";
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace perf_sampler::core
