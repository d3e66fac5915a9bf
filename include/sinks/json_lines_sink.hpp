#pragma once

#include <iosfwd>

#include <nlohmann/json.hpp>

#include "model/reading_frame.hpp"

namespace perf_sampler::sinks {

// One JSON object per frame and line. Values stay numeric; a reading without
// a value is null.
class JsonLinesSink {
 public:
  explicit JsonLinesSink(std::ostream& out);

  void publish(const model::reading_frame& frame) const;

  static nlohmann::json to_json(const model::reading_frame& frame);

 private:
  std::ostream& out_;
};

}  // namespace perf_sampler::sinks
