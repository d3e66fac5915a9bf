#include "sinks/text_sink.hpp"

#include <ostream>

namespace perf_sampler::sinks {

TextSink::TextSink(std::ostream& out) : out_(out) {}

void TextSink::publish(const model::reading_frame& frame) const {
  out_ << "[counters] tick=" << frame.tick;
  for (const model::counter_reading& reading : frame.readings) {
    out_ << ' ' << reading.name << '=';
    if (reading.value.has_value()) {
      out_ << reading.formatted;
    }
  }
  out_ << '\n';
  out_.flush();
}

}  // namespace perf_sampler::sinks
