#pragma once
#include "chart/ICanvasRenderer.hpp"
#include <vector>

namespace tickplot::chart {

struct Marker {
  int row{0};
  int col{0};
  Cell cell{};
};

class DotRenderer : public ICanvasRenderer {
public:
  DotRenderer(const GlyphSet& glyphs, model::DotValues dots, bool use_color)
      : glyphs_(glyphs), dots_(dots), use_color_(use_color) {}

  void paint(const model::PriceSeries& series,
             const model::PriceBounds& bounds,
             Canvas& canvas) const override;
  [[nodiscard]] const char* name() const override { return "dot"; }

  // Markers for point i in draw order high, low, close, filtered by the
  // configured dot values. A later marker replaces an earlier one on the
  // same cell.
  [[nodiscard]] std::vector<Marker> markers_for(const model::PriceSeries& series, size_t i,
                                                const model::PriceBounds& bounds,
                                                int rows, int cols) const;

private:
  const GlyphSet& glyphs_;
  model::DotValues dots_;
  bool use_color_;
};

} // namespace tickplot::chart
