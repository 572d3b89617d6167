#include "model/Interval.hpp"

namespace tickplot::model {

const std::vector<std::string>& valid_interval_tokens() {
  static const std::vector<std::string> tokens = {
    "1m", "3m", "5m", "15m", "30m",
    "1h", "2h", "4h", "6h", "8h", "12h",
    "1d", "3d", "1w", "1M",
  };
  return tokens;
}

Granularity granularity_of(std::string_view token) {
  if (token.empty()) return Granularity::Minute;
  switch (token.back()) {
    case 'M': return Granularity::Month;
    case 'w': return Granularity::Week;
    case 'd': return Granularity::Day;
    case 'h': return Granularity::Hour;
    default:  return Granularity::Minute;
  }
}

std::optional<Interval> parse_interval(std::string_view token) {
  for (const auto& t : valid_interval_tokens()) {
    if (t == token) return Interval{t, granularity_of(token)};
  }
  return std::nullopt;
}

} // namespace tickplot::model
