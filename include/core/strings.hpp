#pragma once

#include <string>
#include <string_view>

namespace perf_sampler::core {

std::string trim(std::string_view value);

std::string to_lower(std::string_view value);

// ASCII case-insensitive comparison; counter names are not case sensitive.
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace perf_sampler::core
