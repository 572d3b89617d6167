#include "ui/Layout.hpp"
#include <algorithm>
#include <cmath>

namespace tickplot::ui {

CanvasPlan plan_canvas(std::optional<int> explicit_width, std::optional<int> explicit_height,
                       int terminal_width, int terminal_height) {
  int avail_w = explicit_width ? *explicit_width - kPriceAxisCols
                               : terminal_width - kPriceAxisCols - kTimeLabelMargin;
  int avail_h = (explicit_height ? *explicit_height : terminal_height) - kReservedRows;

  CanvasPlan p;
  p.graph_width = std::max(kMinGraphCols, std::min(avail_w, terminal_width - kPriceAxisCols));
  p.graph_height = std::max(kMinGraphRows, std::min(avail_h, terminal_height - kReservedRows));
  return p;
}

int plan_periods(int graph_width, model::ChartStyle style) {
  const double per_point = (style == model::ChartStyle::Candle) ? 2.0 : 1.5;
  int n = static_cast<int>(std::floor(std::max(0, graph_width) / per_point));
  return std::clamp(n, kMinPeriods, kMaxPeriods);
}

} // namespace tickplot::ui
