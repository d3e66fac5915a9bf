#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/timestamp.hpp"
#include "counters/counter_handle.hpp"

namespace perf_sampler::counters {

// Performance counters backed by procfs.
//
// Categories: Process, Processor, Memory, System, Network Interface.
// Multi-instance categories expose "_Total"; an empty instance selects it.
// Processes sharing a name are told apart as "name", "name#1", ... in pid order.
//
// Process instance names are resolved against the last process listing for
// up to kProcessListingTtl clock ticks, so a name handed out by
// instance_names() keeps naming the same pid while other processes come and go.
class ProcfsProvider final : public CounterProvider {
 public:
  using Clock = std::function<std::int64_t()>;

  static constexpr const char* kTotalInstance = "_Total";
  static constexpr std::int64_t kProcessListingTtl = core::kMonotonicFrequency;

  struct ProcessEntry {
    std::string name;
    std::int64_t pid{0};
    std::uint64_t starttime{0};
  };

  ProcfsProvider();
  explicit ProcfsProvider(std::string proc_root, Clock clock = {});

  std::unique_ptr<CounterHandle> open(const CounterPath& path, bool read_only) override;

  std::vector<std::string> instance_names(const std::string& category) override;

  [[nodiscard]] std::vector<std::string> category_names() const;
  [[nodiscard]] std::vector<std::string> counter_names(const std::string& category) const;

  [[nodiscard]] const std::string& proc_root() const noexcept;

  [[nodiscard]] bool is_local_machine(const std::string& machine_name) const;

 private:
  const std::vector<ProcessEntry>& refresh_process_listing();
  const ProcessEntry* find_process(const std::string& instance);

  std::string proc_root_;
  Clock clock_;
  std::string host_name_;
  std::vector<ProcessEntry> process_listing_{};
  std::int64_t process_listing_taken_{0};
  bool has_process_listing_{false};
};

}  // namespace perf_sampler::counters
