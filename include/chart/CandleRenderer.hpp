#pragma once
#include "chart/ICanvasRenderer.hpp"
#include <array>

namespace tickplot::chart {

// A vertical run of identical cells, rows inclusive.
struct Stroke {
  int row_from{0};
  int row_to{0};
  int col{0};
  Cell cell{};
};

class CandleRenderer : public ICanvasRenderer {
public:
  CandleRenderer(const GlyphSet& glyphs, bool use_color)
      : glyphs_(glyphs), use_color_(use_color) {}

  void paint(const model::PriceSeries& series,
             const model::PriceBounds& bounds,
             Canvas& canvas) const override;
  [[nodiscard]] const char* name() const override { return "candle"; }

  // Strokes for point i in draw order: wick first, then body. Applying them
  // in sequence is what makes the body win where the two overlap.
  [[nodiscard]] std::array<Stroke, 2> strokes_for(const model::PriceSeries& series, size_t i,
                                                  const model::PriceBounds& bounds,
                                                  int rows, int cols) const;

private:
  const GlyphSet& glyphs_;
  bool use_color_;
};

} // namespace tickplot::chart
