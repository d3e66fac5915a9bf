#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/strings.hpp"

namespace perf_sampler::core {
namespace {

constexpr const char* kCountersPrefix = "counters.";

// '#' starts a comment at the beginning of a line or after whitespace, so
// instance names such as "worker#1" survive. A quote opening a word starts
// quoted text, which is never a comment.
void strip_comment(std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    const bool after_space = i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0;
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if ((c == '"' || c == '\'') && (after_space || line[i - 1] == ':')) {
      quote = c;
    } else if (c == '#' && after_space) {
      line.erase(i);
      return;
    }
  }
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer: " + value);
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer: " + value);
  }
  return parsed;
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

CounterConfig& counter_entry(HostConfig& config, const std::string& name) {
  const auto it = std::find_if(config.counters.begin(), config.counters.end(),
                               [&name](const CounterConfig& counter) { return counter.name == name; });
  if (it != config.counters.end()) {
    return *it;
  }
  config.counters.push_back(CounterConfig{});
  config.counters.back().name = name;
  return config.counters.back();
}

void apply_counter_key(HostConfig& config, const std::string& key, const std::string& value) {
  const std::string rest = key.substr(std::string(kCountersPrefix).size());
  const auto split = rest.rfind('.');
  if (split == std::string::npos || split == 0) {
    throw std::runtime_error("counter keys must look like counters.<name>.<field>: " + key);
  }

  CounterConfig& counter = counter_entry(config, rest.substr(0, split));
  const std::string field = rest.substr(split + 1);

  if (field == "category") {
    counter.settings.category = value;
  } else if (field == "counter") {
    counter.settings.counter = value;
  } else if (field == "instance") {
    counter.settings.instance = value;
  } else if (field == "machine_name") {
    counter.settings.machine_name = value;
  } else if (field == "precision") {
    const auto precision = parse_integer(key, value);
    if (precision < -1 || precision > 15) {
      throw std::runtime_error(key + " must be in range -1..15");
    }
    counter.precision = static_cast<int>(precision);
  } else if (field == "locale") {
    counter.locale = value;
  } else if (field == "every_ticks") {
    const auto every = parse_integer(key, value);
    if (every <= 0) {
      throw std::runtime_error(key + " must be greater than 0");
    }
    counter.every_ticks = static_cast<std::uint64_t>(every);
  } else {
    throw std::runtime_error("unknown counter setting: " + key);
  }
}

void apply_key_value(HostConfig& config, const std::string& key, const std::string& value) {
  if (key == "sampler.tick_rate_hz") {
    const auto hz = parse_integer(key, value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / static_cast<int>(hz));
    return;
  }

  if (key == "sampler.output") {
    const std::string lower = to_lower(value);
    if (lower == "text") {
      config.output = OutputFormat::text;
    } else if (lower == "json") {
      config.output = OutputFormat::json;
    } else {
      throw std::runtime_error("sampler.output must be text or json");
    }
    return;
  }

  if (key == "sampler.log_level") {
    if (!parse_log_level(to_lower(value), config.log_level)) {
      throw std::runtime_error("sampler.log_level must be one of debug, info, warn, error");
    }
    return;
  }

  if (key.rfind(kCountersPrefix, 0) == 0) {
    apply_counter_key(config, key, value);
  }
}

void validate(const HostConfig& config) {
  for (const CounterConfig& counter : config.counters) {
    if (counter.settings.category.empty()) {
      throw std::runtime_error("counters." + counter.name + ".category is required");
    }
    if (counter.settings.counter.empty()) {
      throw std::runtime_error("counters." + counter.name + ".counter is required");
    }
  }
}

}  // namespace

HostConfig parse_host_config(std::istream& input) {
  HostConfig config{};

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() != depth) {
      sections.resize(depth);
    }

    if (value.empty() && colon_pos + 1 == stripped.size()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

HostConfig load_host_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  return parse_host_config(input);
}

}  // namespace perf_sampler::core
