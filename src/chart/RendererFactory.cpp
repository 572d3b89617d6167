#include "chart/CandleRenderer.hpp"
#include "chart/DotRenderer.hpp"

namespace tickplot::chart {

std::unique_ptr<ICanvasRenderer> make_renderer(model::ChartStyle style,
                                               model::DotValues dots,
                                               const GlyphSet& glyphs,
                                               bool use_color) {
  if (style == model::ChartStyle::Dot)
    return std::make_unique<DotRenderer>(glyphs, dots, use_color);
  return std::make_unique<CandleRenderer>(glyphs, use_color);
}

} // namespace tickplot::chart
