#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perf_sampler::model {

struct counter_reading {
    std::string name;
    std::string category;
    std::string counter;
    std::string instance;

    // Unset when the counter was not rendered on this tick or rendering failed.
    std::optional<float> value;
    std::string formatted;
    std::string error;
};

// Everything the host rendered during one tick.
struct reading_frame {
    std::uint64_t timestamp_ns{0};
    std::uint64_t tick{0};
    std::vector<counter_reading> readings;
};

}  // namespace perf_sampler::model
