#pragma once

#include "chart/Canvas.hpp"
#include "model/PriceSeries.hpp"
#include "model/RenderConfig.hpp"
#include "ui/Layout.hpp"
#include "ui/Terminal.hpp"
#include <string>
#include <vector>

namespace tickplot::ui {

// Individual sections, exposed for tests. Each returns lines without '\n'.
std::vector<std::string> legend_lines(const model::PriceSeries& s, const model::RenderConfig& cfg,
                                      int terminal_width);
std::string canvas_line(const chart::Canvas& canvas, int row, const model::PriceBounds& b,
                        const chart::GlyphSet& glyphs, bool use_color, int terminal_width);
std::string axis_line(int graph_width, const chart::GlyphSet& glyphs, int terminal_width);
// Empty string when no label line is drawn (narrow canvas or no data).
std::string time_label_line(const model::PriceSeries& s, const std::string& interval,
                            int graph_width, int terminal_width);
std::string footer_line(const model::RenderConfig& cfg, const Environment& env);

// Assembles legend, price rows, axis, time labels and footer.
std::string compose_chart(const model::PriceSeries& s, const model::RenderConfig& cfg,
                          const Environment& env, const chart::Canvas& canvas,
                          const model::PriceBounds& bounds);

// Full pipeline: layout, bounds, paint, compose. Deterministic; never throws
// on malformed series data.
std::string render_chart(const model::PriceSeries& s, const model::RenderConfig& cfg,
                         const Environment& env);

} // namespace tickplot::ui
