#include "chart/DotRenderer.hpp"
#include "chart/PriceScale.hpp"

namespace tickplot::chart {

std::vector<Marker> DotRenderer::markers_for(const model::PriceSeries& s, size_t i,
                                             const model::PriceBounds& b,
                                             int rows, int cols) const {
  using model::DotValues;
  std::vector<Marker> out;
  out.reserve(3);
  const int x = index_to_col(i, s.size(), cols);
  auto tone = [&](Tone t) { return use_color_ ? t : Tone::None; };

  if (dots_ == DotValues::All || dots_ == DotValues::High)
    out.push_back({price_to_row(s.high[i], b, rows), x, Cell{glyphs_.high_marker, tone(Tone::High)}});
  if (dots_ == DotValues::All || dots_ == DotValues::Low)
    out.push_back({price_to_row(s.low[i], b, rows), x, Cell{glyphs_.low_marker, tone(Tone::Low)}});
  if (dots_ == DotValues::All || dots_ == DotValues::Close)
    out.push_back({price_to_row(s.close[i], b, rows), x, Cell{glyphs_.close_marker, tone(Tone::Close)}});
  return out;
}

void DotRenderer::paint(const model::PriceSeries& series,
                        const model::PriceBounds& bounds,
                        Canvas& canvas) const {
  const size_t n = series.size();
  if (n == 0 || canvas.rows() == 0 || canvas.cols() == 0) return;
  for (size_t i = 0; i < n; ++i) {
    for (const auto& m : markers_for(series, i, bounds, canvas.rows(), canvas.cols()))
      canvas.set(m.row, m.col, m.cell);
  }
}

} // namespace tickplot::chart
