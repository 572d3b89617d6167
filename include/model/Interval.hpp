#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tickplot::model {

enum class Granularity { Minute, Hour, Day, Week, Month };

struct Interval {
  std::string token;     // exchange literal, e.g. "15m", "4h", "1M"
  Granularity granularity{Granularity::Day};
};

// Accepted tokens: 1m 3m 5m 15m 30m 1h 2h 4h 6h 8h 12h 1d 3d 1w 1M.
// Case matters: "1M" is one month, "1m" one minute.
[[nodiscard]] std::optional<Interval> parse_interval(std::string_view token);
[[nodiscard]] const std::vector<std::string>& valid_interval_tokens();

// Granularity implied by a token's suffix, regardless of whether the token
// is in the accepted set. Used for axis label formatting.
[[nodiscard]] Granularity granularity_of(std::string_view token);

} // namespace tickplot::model
