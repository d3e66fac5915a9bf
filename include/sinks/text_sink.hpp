#pragma once

#include <iosfwd>

#include "model/reading_frame.hpp"

namespace perf_sampler::sinks {

class TextSink {
 public:
  explicit TextSink(std::ostream& out);

  void publish(const model::reading_frame& frame) const;

 private:
  std::ostream& out_;
};

}  // namespace perf_sampler::sinks
