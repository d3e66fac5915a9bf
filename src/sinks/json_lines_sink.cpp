#include "sinks/json_lines_sink.hpp"

#include <ostream>
#include <utility>

namespace perf_sampler::sinks {

JsonLinesSink::JsonLinesSink(std::ostream& out) : out_(out) {}

void JsonLinesSink::publish(const model::reading_frame& frame) const {
  out_ << to_json(frame).dump() << '\n';
  out_.flush();
}

nlohmann::json JsonLinesSink::to_json(const model::reading_frame& frame) {
  nlohmann::json readings = nlohmann::json::array();
  for (const model::counter_reading& reading : frame.readings) {
    nlohmann::json entry{{"name", reading.name},
                         {"category", reading.category},
                         {"counter", reading.counter},
                         {"instance", reading.instance},
                         {"value", nullptr}};
    if (reading.value.has_value()) {
      entry["value"] = *reading.value;
    }
    if (!reading.error.empty()) {
      entry["error"] = reading.error;
    }
    readings.push_back(std::move(entry));
  }

  return nlohmann::json{{"timestamp_ns", frame.timestamp_ns}, {"tick", frame.tick}, {"readings", readings}};
}

}  // namespace perf_sampler::sinks
