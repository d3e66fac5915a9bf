#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "core/log.hpp"
#include "counters/counter_handle.hpp"

namespace perf_sampler::core {

enum class OutputFormat : std::uint8_t {
  text = 0,
  json = 1,
};

struct CounterConfig {
  std::string name;
  counters::CounterSettings settings{};
  // -1 prints the shortest representation.
  int precision{-1};
  // Name passed to std::locale; empty keeps the classic locale.
  std::string locale{};
  std::uint64_t every_ticks{1};
};

struct HostConfig {
  std::chrono::milliseconds tick_interval{1000};
  OutputFormat output{OutputFormat::text};
  LogLevel log_level{LogLevel::info};
  std::vector<CounterConfig> counters{};
};

HostConfig load_host_config(const std::string& path);

HostConfig parse_host_config(std::istream& input);

}  // namespace perf_sampler::core
