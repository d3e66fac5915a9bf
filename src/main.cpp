#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/log.hpp"
#include "core/poller.hpp"
#include "counters/procfs_provider.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const perf_sampler::core::HostConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | output=" << (config.output == perf_sampler::core::OutputFormat::json ? "json" : "text")
         << " | log_level=" << perf_sampler::core::to_string(config.log_level)
         << " | counters=" << config.counters.size();
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/perf-sampler.yaml";

  perf_sampler::core::HostConfig config{};
  try {
    config = perf_sampler::core::load_host_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  perf_sampler::core::set_log_level(config.log_level);
  perf_sampler::core::log(perf_sampler::core::LogLevel::info, "sampler", format_config_settings(config, config_path));

  perf_sampler::counters::ProcfsProvider provider{};
  perf_sampler::core::Poller poller{config, provider, std::cout};
  if (poller.initialize() == 0) {
    perf_sampler::core::log(perf_sampler::core::LogLevel::error, "sampler", "no counter could be opened; exiting");
    return 1;
  }

  while (g_shutdown_requested == 0) {
    poller.run_for_ticks(1);
  }

  poller.close();
  perf_sampler::core::log(perf_sampler::core::LogLevel::info, "sampler", "shutdown signal received; exiting cleanly");

  return 0;
}
