#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace tickplot::chart {

// Color tag carried by a cell. None means "print without escape codes".
enum class Tone { None, Bullish, Bearish, Wick, High, Low, Close };

// SGR foreground code for a tone ("92", ...), empty for Tone::None.
[[nodiscard]] const char* tone_sgr_code(Tone t);

struct Cell {
  const char* glyph{" "};  // points into a static GlyphSet
  Tone tone{Tone::None};
};

// Glyph tables; both are immutable statics.
struct GlyphSet {
  const char* wick;
  const char* body;
  const char* high_marker;
  const char* low_marker;
  const char* close_marker;
  const char* separator;
  const char* corner;
  const char* horizontal;
};

[[nodiscard]] const GlyphSet& unicode_glyphs();
[[nodiscard]] const GlyphSet& ascii_glyphs();
[[nodiscard]] inline const GlyphSet& glyphs_for(bool use_unicode) {
  return use_unicode ? unicode_glyphs() : ascii_glyphs();
}

// rows x cols grid of cells, row-major. Row 0 is the top (highest price).
class Canvas {
public:
  Canvas(int rows, int cols);

  [[nodiscard]] int rows() const { return rows_; }
  [[nodiscard]] int cols() const { return cols_; }
  [[nodiscard]] bool contains(int row, int col) const {
    return row >= 0 && row < rows_ && col >= 0 && col < cols_;
  }

  // Out-of-range writes are dropped.
  void set(int row, int col, const Cell& cell);
  [[nodiscard]] const Cell& at(int row, int col) const;

  // Glyphs of one row concatenated, no color.
  [[nodiscard]] std::string row_text(int row) const;

private:
  int rows_;
  int cols_;
  std::vector<Cell> cells_;
};

} // namespace tickplot::chart
