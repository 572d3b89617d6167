#pragma once

#include "model/RenderConfig.hpp"
#include <optional>

namespace tickplot::ui {

// Columns left of the canvas: 10 for the price label, 1 for the separator.
constexpr int kPriceAxisCols = 11;
// Extra room kept free for time labels when the width is auto-sized.
constexpr int kTimeLabelMargin = 10;
// Legend, axis and footer rows.
constexpr int kReservedRows = 4;
constexpr int kMinGraphCols = 20;
constexpr int kMinGraphRows = 5;
constexpr int kMinPeriods = 10;
constexpr int kMaxPeriods = 1000;

struct CanvasPlan {
  int graph_width{kMinGraphCols};
  int graph_height{kMinGraphRows};
};

CanvasPlan plan_canvas(std::optional<int> explicit_width, std::optional<int> explicit_height,
                       int terminal_width, int terminal_height);

// Periods that fit graph_width at the style's density (2 cols per candle,
// 1.5 per dot), clamped to [10, 1000].
int plan_periods(int graph_width, model::ChartStyle style);

} // namespace tickplot::ui
