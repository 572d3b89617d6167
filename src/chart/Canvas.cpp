#include "chart/Canvas.hpp"
#include <algorithm>

namespace tickplot::chart {

namespace {

constexpr GlyphSet kUnicode{"│", "█", "▲", "▼", "●", "│", "└", "─"};
constexpr GlyphSet kAscii{"|", "#", "^", "v", "o", "|", "+", "-"};

const Cell kBlank{};

} // namespace

const char* tone_sgr_code(Tone t) {
  switch (t) {
    case Tone::Bullish: return "92";  // bright green
    case Tone::Bearish: return "91";  // bright red
    case Tone::Wick:    return "90";  // bright black (grey)
    case Tone::High:    return "96";  // bright cyan
    case Tone::Low:     return "93";  // bright yellow
    case Tone::Close:   return "97";  // bright white
    case Tone::None:    break;
  }
  return "";
}

const GlyphSet& unicode_glyphs() { return kUnicode; }
const GlyphSet& ascii_glyphs() { return kAscii; }

Canvas::Canvas(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)),
      cells_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_)) {}

void Canvas::set(int row, int col, const Cell& cell) {
  if (!contains(row, col)) return;
  cells_[static_cast<size_t>(row) * cols_ + col] = cell;
}

const Cell& Canvas::at(int row, int col) const {
  if (!contains(row, col)) return kBlank;
  return cells_[static_cast<size_t>(row) * cols_ + col];
}

std::string Canvas::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  out.reserve(static_cast<size_t>(cols_) * 3);
  for (int c = 0; c < cols_; ++c) out += at(row, c).glyph;
  return out;
}

} // namespace tickplot::chart
