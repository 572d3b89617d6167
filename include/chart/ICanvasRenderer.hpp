#pragma once
#include "chart/Canvas.hpp"
#include "model/PriceSeries.hpp"
#include "model/RenderConfig.hpp"
#include <memory>

namespace tickplot::chart {

// Paints a price series onto a canvas. Implementations only write cells;
// they never print and never throw on odd input.
class ICanvasRenderer {
public:
  virtual ~ICanvasRenderer() = default;

  virtual void paint(const model::PriceSeries& series,
                     const model::PriceBounds& bounds,
                     Canvas& canvas) const = 0;

  // Short style name used in the footer ("candle", "dot")
  [[nodiscard]] virtual const char* name() const = 0;
};

[[nodiscard]] std::unique_ptr<ICanvasRenderer> make_renderer(model::ChartStyle style,
                                                             model::DotValues dots,
                                                             const GlyphSet& glyphs,
                                                             bool use_color);

} // namespace tickplot::chart
