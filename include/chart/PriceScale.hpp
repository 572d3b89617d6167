#pragma once
#include "model/PriceSeries.hpp"

namespace tickplot::chart {

// Padded [min, max] over every high, low and close value:
//   min = floor(lowest)  - 5% of range
//   max = ceil(highest)  + 5% of range
// Empty series -> {0, 0}. A flat series on an integral price collapses to
// min == max; price_to_row handles that case.
[[nodiscard]] model::PriceBounds compute_bounds(const model::PriceSeries& s);

// Row for a price, row 0 = top = highest price. Always in [0, height-1];
// degenerate bounds map every price to height/2.
[[nodiscard]] int price_to_row(double price, const model::PriceBounds& b, int height);

// Column centred in the span allotted to point i of n, clamped to width-1.
[[nodiscard]] int index_to_col(size_t i, size_t n, int width);

} // namespace tickplot::chart
