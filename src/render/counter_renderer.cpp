#include "render/counter_renderer.hpp"

#include <algorithm>
#include <charconv>
#include <climits>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/error.hpp"

namespace perf_sampler::render {
namespace {

// Applies the locale's decimal point and digit grouping to a plain
// "-123456.789" number.
std::string localize_number(std::string number, const std::locale& locale) {
  const auto& punct = std::use_facet<std::numpunct<char>>(locale);

  std::size_t point = number.find('.');
  if (point == std::string::npos) {
    point = number.size();
  } else {
    number[point] = punct.decimal_point();
  }

  const std::string grouping = punct.grouping();
  const std::size_t first_digit = !number.empty() && number.front() == '-' ? 1 : 0;
  std::size_t group = 0;
  while (group < grouping.size()) {
    const int size = static_cast<unsigned char>(grouping[group]);
    if (size <= 0 || size == CHAR_MAX || point - first_digit <= static_cast<std::size_t>(size)) {
      break;
    }
    point -= static_cast<std::size_t>(size);
    number.insert(point, 1, punct.thousands_sep());
    // The last group size repeats.
    group = std::min(group + 1, grouping.size() - 1);
  }
  return number;
}

}  // namespace

std::string format_value(const float value, const int precision, const std::locale& locale) {
  if (precision < 0 && std::isfinite(value)) {
    char buffer[128];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (result.ec == std::errc{}) {
      return localize_number(std::string(buffer, result.ptr), locale);
    }
  }

  std::ostringstream output;
  output.imbue(locale);
  if (precision >= 0) {
    output << std::fixed << std::setprecision(precision);
  }
  output << value;
  return output.str();
}

std::locale make_locale(const std::string& name) {
  if (name.empty()) {
    return std::locale::classic();
  }
  try {
    return std::locale(name);
  } catch (const std::runtime_error& ex) {
    throw core::CounterError(core::errc::invalid_argument, "unknown locale " + name + ": " + ex.what());
  }
}

CounterRenderer::CounterRenderer(counters::CounterProvider& provider, counters::CounterSettings settings,
                                 FormatOptions format)
    : provider_(provider), settings_(std::move(settings)), format_(std::move(format)) {}

CounterRenderer::~CounterRenderer() { close(); }

void CounterRenderer::initialize() {
  close();
  locale_ = make_locale(format_.locale);
  sampler_.open(provider_, settings_);
}

void CounterRenderer::close() noexcept { sampler_.close(); }

bool CounterRenderer::initialized() const noexcept { return sampler_.is_open(); }

float CounterRenderer::render_value() { return sampler_.value(); }

std::string CounterRenderer::render() { return format(render_value()); }

std::string CounterRenderer::format(const float value) const { return format_value(value, format_.precision, locale_); }

const counters::CounterSettings& CounterRenderer::settings() const noexcept { return settings_; }

}  // namespace perf_sampler::render
