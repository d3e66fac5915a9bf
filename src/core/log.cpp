#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace perf_sampler::core {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::info};
std::mutex g_log_mutex;
LogSink g_sink{};

}  // namespace

void set_log_level(const LogLevel level) noexcept { g_min_level.store(level); }

LogLevel log_level() noexcept { return g_min_level.load(); }

bool log_enabled(const LogLevel level) noexcept {
  return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(g_min_level.load());
}

void set_log_sink(LogSink sink) {
  std::scoped_lock lock(g_log_mutex);
  g_sink = std::move(sink);
}

void log(const LogLevel level, const char* tag, const std::string& message) {
  if (!log_enabled(level)) {
    return;
  }

  std::string line;
  line.reserve(message.size() + 16);
  line.append("[").append(tag).append("] ");
  if (level == LogLevel::warn || level == LogLevel::error) {
    line.append(to_string(level)).append(": ");
  }
  line.append(message);

  std::scoped_lock lock(g_log_mutex);
  if (g_sink) {
    g_sink(level, line);
    return;
  }
  std::cerr << line << '\n';
}

const char* to_string(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warn:
      return "warn";
    case LogLevel::error:
      return "error";
  }
  return "unknown";
}

bool parse_log_level(const std::string& text, LogLevel& level) noexcept {
  if (text == "debug") {
    level = LogLevel::debug;
  } else if (text == "info") {
    level = LogLevel::info;
  } else if (text == "warn" || text == "warning") {
    level = LogLevel::warn;
  } else if (text == "error") {
    level = LogLevel::error;
  } else {
    return false;
  }
  return true;
}

}  // namespace perf_sampler::core
