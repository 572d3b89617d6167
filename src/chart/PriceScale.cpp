#include "chart/PriceScale.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tickplot::chart {

model::PriceBounds compute_bounds(const model::PriceSeries& s) {
  const size_t n = s.size();
  if (n == 0) return {};
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  auto take = [&](double v) {
    if (!std::isfinite(v)) return;
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  };
  for (size_t i = 0; i < n; ++i) {
    take(s.high[i]);
    take(s.low[i]);
    take(s.close[i]);
  }
  if (lo > hi) return {};  // nothing finite
  const double pad = (hi - lo) * 0.05;
  return {std::floor(lo) - pad, std::ceil(hi) + pad};
}

int price_to_row(double price, const model::PriceBounds& b, int height) {
  if (height <= 0) return 0;
  const int mid = height / 2;
  if (b.max_price == b.min_price) return mid;
  const double ratio = (price - b.min_price) / (b.max_price - b.min_price);
  const double y = (height - 1) - ratio * (height - 1);
  if (!std::isfinite(y)) return mid;
  // clamp in floating point first so the int conversion cannot overflow
  const double yc = std::clamp(y, -1.0, static_cast<double>(height));
  return std::clamp(static_cast<int>(yc), 0, height - 1);
}

int index_to_col(size_t i, size_t n, int width) {
  if (width <= 0 || n == 0) return 0;
  const auto w = static_cast<size_t>(width);
  const size_t per_point = std::max<size_t>(1, w / n);
  const size_t col = (i * w) / n + per_point / 2;
  return static_cast<int>(std::min(col, w - 1));
}

} // namespace tickplot::chart
