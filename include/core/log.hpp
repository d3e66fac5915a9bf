#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace perf_sampler::core {

enum class LogLevel : std::uint8_t {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
};

using LogSink = std::function<void(LogLevel, const std::string& line)>;

// Lines below the minimum level are dropped before formatting.
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;
[[nodiscard]] bool log_enabled(LogLevel level) noexcept;

// Replaces the std::cerr writer; an empty sink restores it.
void set_log_sink(LogSink sink);

// Writes "[tag] message" as one line.
void log(LogLevel level, const char* tag, const std::string& message);

const char* to_string(LogLevel level) noexcept;
bool parse_log_level(const std::string& text, LogLevel& level) noexcept;

}  // namespace perf_sampler::core
