#include <cstdint>
#include <iostream>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/log.hpp"
#include "counters/counter_handle.hpp"
#include "counters/instance_resolver.hpp"
#include "counters/rate_sampler.hpp"

using perf_sampler::core::CounterError;
using perf_sampler::core::errc;
using perf_sampler::core::LogLevel;
using perf_sampler::counters::CounterHandle;
using perf_sampler::counters::CounterPath;
using perf_sampler::counters::CounterProvider;
using perf_sampler::counters::CounterSettings;
using perf_sampler::counters::CounterType;
using perf_sampler::counters::open_counter_handle;
using perf_sampler::counters::RawSample;
using perf_sampler::counters::resolve_process_instance;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

enum class EnumerateFailure { none, runtime_error, bad_alloc };

struct ProviderState {
  std::vector<std::pair<std::string, std::int64_t>> processes{};
  EnumerateFailure enumerate_failure{EnumerateFailure::none};
  int open_calls{0};
  int id_reads{0};
  int closed_handles{0};
  std::vector<CounterPath> opened{};
};

class FakeHandle final : public CounterHandle {
 public:
  FakeHandle(ProviderState& state, const std::int64_t raw) : state_(state), raw_(raw) {}
  ~FakeHandle() override { close(); }

  RawSample next_sample() override {
    if (!open_) {
      throw CounterError(errc::handle_closed, "fake handle closed");
    }
    RawSample sample{};
    sample.timestamp = 1;
    sample.raw_value = raw_;
    sample.counter_type = CounterType::number_of_items;
    return sample;
  }

  void close() noexcept override {
    if (open_) {
      ++state_.closed_handles;
      open_ = false;
    }
  }

  [[nodiscard]] bool is_open() const noexcept override { return open_; }

 private:
  ProviderState& state_;
  std::int64_t raw_;
  bool open_{true};
};

class FakeProvider final : public CounterProvider {
 public:
  explicit FakeProvider(ProviderState& state) : state_(state) {}

  std::unique_ptr<CounterHandle> open(const CounterPath& path, bool /*read_only*/) override {
    ++state_.open_calls;
    state_.opened.push_back(path);
    if (path.counter == perf_sampler::counters::kProcessIdCounter) {
      ++state_.id_reads;
      for (const auto& [instance, pid] : state_.processes) {
        if (instance == path.instance) {
          return std::make_unique<FakeHandle>(state_, pid);
        }
      }
      throw CounterError(errc::instance_not_found, path.instance);
    }
    return std::make_unique<FakeHandle>(state_, 0);
  }

  std::vector<std::string> instance_names(const std::string& /*category*/) override {
    if (state_.enumerate_failure == EnumerateFailure::runtime_error) {
      throw std::runtime_error("enumeration failed");
    }
    if (state_.enumerate_failure == EnumerateFailure::bad_alloc) {
      throw std::bad_alloc{};
    }
    std::vector<std::string> names;
    for (const auto& process : state_.processes) {
      names.push_back(process.first);
    }
    return names;
  }

 private:
  ProviderState& state_;
};

struct CapturedLog {
  std::vector<std::pair<LogLevel, std::string>> lines{};

  CapturedLog() {
    perf_sampler::core::set_log_level(LogLevel::debug);
    perf_sampler::core::set_log_sink(
        [this](const LogLevel level, const std::string& line) { lines.emplace_back(level, line); });
  }

  ~CapturedLog() {
    perf_sampler::core::set_log_sink({});
    perf_sampler::core::set_log_level(LogLevel::info);
  }

  [[nodiscard]] bool contains(const LogLevel level, const std::string& text) const {
    for (const auto& [line_level, line] : lines) {
      if (line_level == level && line.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }
};

int test_resolves_matching_instance() {
  const char* name = "test_resolves_matching_instance";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);

  if (resolve_process_instance(provider, "Process", 200) != "P2") {
    return fail(name, "pid 200 should resolve to P2");
  }
  if (state.id_reads != 2 || state.closed_handles != 2) {
    return fail(name, "every id handle should be closed before returning");
  }
  return 0;
}

int test_stops_at_first_match() {
  const char* name = "test_stops_at_first_match";

  ProviderState state{};
  state.processes = {{"worker", 10}, {"worker#1", 20}, {"worker#2", 30}};
  FakeProvider provider(state);

  if (resolve_process_instance(provider, "Process", 10) != "worker") {
    return fail(name, "pid 10 should resolve to worker");
  }
  if (state.id_reads != 1) {
    return fail(name, "enumeration should stop at the first match");
  }
  return 0;
}

int test_no_match_logs_debug() {
  const char* name = "test_no_match_logs_debug";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);
  CapturedLog captured;

  if (!resolve_process_instance(provider, "Process", 300).empty()) {
    return fail(name, "unknown pid should resolve to an empty instance");
  }
  if (!captured.contains(LogLevel::debug, "process_id=300")) {
    return fail(name, "missing debug diagnostic");
  }
  if (state.closed_handles != 2) {
    return fail(name, "id handles should be closed");
  }
  return 0;
}

int test_recoverable_error_is_logged_and_swallowed() {
  const char* name = "test_recoverable_error_is_logged_and_swallowed";

  ProviderState state{};
  state.enumerate_failure = EnumerateFailure::runtime_error;
  FakeProvider provider(state);
  CapturedLog captured;

  if (!resolve_process_instance(provider, "Process", 100).empty()) {
    return fail(name, "failed enumeration should resolve to an empty instance");
  }
  if (!captured.contains(LogLevel::warn, "enumeration failed")) {
    return fail(name, "missing warning diagnostic");
  }
  return 0;
}

int test_id_read_failure_aborts_resolution() {
  const char* name = "test_id_read_failure_aborts_resolution";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);

  // The enumerated instance vanishes before its id is read.
  class VanishingProvider final : public CounterProvider {
   public:
    explicit VanishingProvider(FakeProvider& inner) : inner_(inner) {}
    std::unique_ptr<CounterHandle> open(const CounterPath& path, bool read_only) override {
      CounterPath renamed = path;
      renamed.instance += "-gone";
      return inner_.open(renamed, read_only);
    }
    std::vector<std::string> instance_names(const std::string& category) override {
      return inner_.instance_names(category);
    }

   private:
    FakeProvider& inner_;
  } vanishing(provider);

  CapturedLog captured;
  if (!resolve_process_instance(vanishing, "Process", 200).empty()) {
    return fail(name, "failed id read should resolve to an empty instance");
  }
  if (state.id_reads != 1) {
    return fail(name, "a failed id read should stop enumeration");
  }
  if (!captured.contains(LogLevel::warn, "failed to auto detect")) {
    return fail(name, "missing warning diagnostic");
  }
  return 0;
}

int test_fatal_error_is_rethrown() {
  const char* name = "test_fatal_error_is_rethrown";

  ProviderState state{};
  state.enumerate_failure = EnumerateFailure::bad_alloc;
  FakeProvider provider(state);

  try {
    (void)resolve_process_instance(provider, "Process", 100);
    return fail(name, "bad_alloc should propagate");
  } catch (const std::bad_alloc&) {
  }
  return 0;
}

int test_open_binds_current_process_instance() {
  const char* name = "test_open_binds_current_process_instance";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);

  const CounterSettings settings{"Process", "% Processor Time", std::nullopt, std::nullopt};
  const auto handle = open_counter_handle(provider, settings, 200);
  if (handle == nullptr || !handle->is_open()) {
    return fail(name, "handle should be open");
  }

  const CounterPath& path = state.opened.back();
  if (path.category != "Process" || path.counter != "% Processor Time" || path.instance != "P2" ||
      !path.machine_name.empty()) {
    return fail(name, "handle should be bound to the detected instance");
  }
  return 0;
}

int test_category_match_ignores_case() {
  const char* name = "test_category_match_ignores_case";

  ProviderState state{};
  state.processes = {{"P1", 100}};
  FakeProvider provider(state);

  const CounterSettings settings{"process", "Working Set", std::string{}, std::nullopt};
  (void)open_counter_handle(provider, settings, 100);
  if (state.id_reads != 1 || state.opened.back().instance != "P1") {
    return fail(name, "an empty instance in any casing of Process should be detected");
  }
  return 0;
}

int test_explicit_instance_skips_detection() {
  const char* name = "test_explicit_instance_skips_detection";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);

  const CounterSettings settings{"Process", "% Processor Time", std::string("P1"), std::nullopt};
  (void)open_counter_handle(provider, settings, 200);
  if (state.id_reads != 0 || state.opened.back().instance != "P1") {
    return fail(name, "explicit instance should be used as is");
  }
  return 0;
}

int test_machine_name_skips_detection() {
  const char* name = "test_machine_name_skips_detection";

  ProviderState state{};
  state.processes = {{"P1", 100}, {"P2", 200}};
  FakeProvider provider(state);

  const CounterSettings settings{"Process", "% Processor Time", std::nullopt, std::string("remote-host")};
  (void)open_counter_handle(provider, settings, 200);
  const CounterPath& path = state.opened.back();
  if (state.id_reads != 0 || !path.instance.empty() || path.machine_name != "remote-host") {
    return fail(name, "remote counters should not auto detect the instance");
  }
  return 0;
}

int test_other_categories_skip_detection() {
  const char* name = "test_other_categories_skip_detection";

  ProviderState state{};
  state.processes = {{"P1", 100}};
  FakeProvider provider(state);

  const CounterSettings settings{"Processor", "% Processor Time", std::nullopt, std::nullopt};
  (void)open_counter_handle(provider, settings, 100);
  if (state.id_reads != 0 || !state.opened.back().instance.empty()) {
    return fail(name, "only the process category auto detects");
  }
  return 0;
}

int test_unresolved_instance_opens_unqualified() {
  const char* name = "test_unresolved_instance_opens_unqualified";

  ProviderState state{};
  state.processes = {{"P1", 100}};
  FakeProvider provider(state);

  const CounterSettings settings{"Process", "% Processor Time", std::nullopt, std::nullopt};
  (void)open_counter_handle(provider, settings, 999);
  if (!state.opened.back().instance.empty() || state.opened.back().counter != "% Processor Time") {
    return fail(name, "unresolved instance should fall back to the empty instance");
  }
  return 0;
}

int test_missing_names_are_rejected() {
  const char* name = "test_missing_names_are_rejected";

  ProviderState state{};
  FakeProvider provider(state);

  try {
    (void)open_counter_handle(provider, CounterSettings{"", "Working Set", std::nullopt, std::nullopt}, 1);
    return fail(name, "empty category should throw");
  } catch (const CounterError& ex) {
    if (ex.code() != errc::invalid_argument) {
      return fail(name, "empty category should be invalid_argument");
    }
  }

  try {
    (void)open_counter_handle(provider, CounterSettings{"Process", "", std::nullopt, std::nullopt}, 1);
    return fail(name, "empty counter should throw");
  } catch (const CounterError& ex) {
    if (ex.code() != errc::invalid_argument) {
      return fail(name, "empty counter should be invalid_argument");
    }
  }

  if (state.open_calls != 0) {
    return fail(name, "provider should not be touched");
  }
  return 0;
}

int test_sampler_instance_name_uses_current_process() {
  const char* name = "test_sampler_instance_name_uses_current_process";

  ProviderState state{};
  state.processes = {{"other", perf_sampler::counters::current_process_id() + 1},
                     {"self", perf_sampler::counters::current_process_id()}};
  FakeProvider provider(state);

  if (perf_sampler::counters::RateSampler::instance_name(provider, "Process") != "self") {
    return fail(name, "instance_name should resolve this process");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_resolves_matching_instance(); rc != 0) return rc;
  if (int rc = test_stops_at_first_match(); rc != 0) return rc;
  if (int rc = test_no_match_logs_debug(); rc != 0) return rc;
  if (int rc = test_recoverable_error_is_logged_and_swallowed(); rc != 0) return rc;
  if (int rc = test_id_read_failure_aborts_resolution(); rc != 0) return rc;
  if (int rc = test_fatal_error_is_rethrown(); rc != 0) return rc;
  if (int rc = test_open_binds_current_process_instance(); rc != 0) return rc;
  if (int rc = test_category_match_ignores_case(); rc != 0) return rc;
  if (int rc = test_explicit_instance_skips_detection(); rc != 0) return rc;
  if (int rc = test_machine_name_skips_detection(); rc != 0) return rc;
  if (int rc = test_other_categories_skip_detection(); rc != 0) return rc;
  if (int rc = test_unresolved_instance_opens_unqualified(); rc != 0) return rc;
  if (int rc = test_missing_names_are_rejected(); rc != 0) return rc;
  if (int rc = test_sampler_instance_name_uses_current_process(); rc != 0) return rc;

  std::cout << "[PASS] resolver unit tests\n";
  return 0;
}
