#include "chart/CandleRenderer.hpp"
#include "chart/PriceScale.hpp"
#include <algorithm>
#include <utility>

namespace tickplot::chart {

std::array<Stroke, 2> CandleRenderer::strokes_for(const model::PriceSeries& s, size_t i,
                                                  const model::PriceBounds& b,
                                                  int rows, int cols) const {
  const double o = s.open[i];
  const double c = s.close[i];
  int y_high = price_to_row(s.high[i], b, rows);
  int y_low = price_to_row(s.low[i], b, rows);
  const int y_open = price_to_row(o, b, rows);
  const int y_close = price_to_row(c, b, rows);

  // Only reachable when the feed reports high < low.
  if (y_high > y_low) std::swap(y_high, y_low);

  const int x = index_to_col(i, s.size(), cols);

  Tone body_tone = Tone::None, wick_tone = Tone::None;
  if (use_color_) {
    body_tone = (c > o) ? Tone::Bullish : Tone::Bearish;
    wick_tone = Tone::Wick;
  }

  Stroke wick{y_high, y_low, x, Cell{glyphs_.wick, wick_tone}};
  Stroke body{std::min(y_open, y_close), std::max(y_open, y_close), x,
              Cell{glyphs_.body, body_tone}};
  return {wick, body};
}

void CandleRenderer::paint(const model::PriceSeries& series,
                           const model::PriceBounds& bounds,
                           Canvas& canvas) const {
  const size_t n = series.size();
  if (n == 0 || canvas.rows() == 0 || canvas.cols() == 0) return;
  for (size_t i = 0; i < n; ++i) {
    for (const auto& st : strokes_for(series, i, bounds, canvas.rows(), canvas.cols())) {
      for (int y = st.row_from; y <= st.row_to; ++y) canvas.set(y, st.col, st.cell);
    }
  }
}

} // namespace tickplot::chart
