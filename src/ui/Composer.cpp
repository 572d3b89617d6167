#include "ui/Composer.hpp"
#include "chart/ICanvasRenderer.hpp"
#include "chart/PriceScale.hpp"
#include "model/Interval.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <sstream>

namespace tickplot::ui {

constexpr int kPriceLabelCols = 10;

std::vector<std::string> legend_lines(const model::PriceSeries& s, const model::RenderConfig& cfg,
                                      int terminal_width) {
  const size_t n = s.size();
  const long long periods = cfg.periods ? *cfg.periods : static_cast<long long>(n);
  std::ostringstream os;
  os << cfg.base_currency << "/" << cfg.quote_currency << " - " << cfg.time_interval
     << " - " << periods << " periods (";
  if (n == 0) {
    os << "no data";
  } else {
    os << format_timestamp(s.timestamps.front(), "%Y-%m-%d %H:%M") << " to "
       << format_timestamp(s.timestamps[n - 1], "%Y-%m-%d %H:%M");
  }
  os << ")";
  std::string legend = truncate_ellipsis(os.str(), terminal_width);
  int underline = std::min(display_cols(legend), terminal_width);
  return {legend, std::string(std::max(0, underline), '='), std::string()};
}

std::string canvas_line(const chart::Canvas& canvas, int row, const model::PriceBounds& b,
                        const chart::GlyphSet& glyphs, bool use_color, int terminal_width) {
  const int h = canvas.rows();
  const double step = h > 1 ? (b.max_price - b.min_price) / (h - 1) : 0.0;
  const double price = b.max_price - step * row;

  std::string line = rjust(format_price_label(price, kPriceLabelCols), kPriceLabelCols);
  line += glyphs.separator;

  // Truncation counts visible cells, never escape bytes.
  const int visible = std::clamp(terminal_width - kPriceAxisCols, 0, canvas.cols());
  for (int c = 0; c < visible; ++c) {
    const auto& cell = canvas.at(row, c);
    if (use_color && cell.tone != chart::Tone::None) {
      line += sgr(chart::tone_sgr_code(cell.tone));
      line += cell.glyph;
      line += sgr_reset();
    } else {
      line += cell.glyph;
    }
  }
  return line;
}

std::string axis_line(int graph_width, const chart::GlyphSet& glyphs, int terminal_width) {
  const int n = std::max(0, std::min(graph_width, terminal_width - kPriceAxisCols));
  return std::string(kPriceLabelCols, ' ') + glyphs.corner + repeat(glyphs.horizontal, n);
}

std::string time_label_line(const model::PriceSeries& s, const std::string& interval,
                            int graph_width, int terminal_width) {
  const size_t n = s.size();
  if (graph_width <= 20 || n == 0) return std::string();

  std::vector<size_t> picks;
  if (n > 2) picks = {0, n / 2, n - 1};
  else picks = {0, n - 1};

  const auto granularity = model::granularity_of(interval);
  const int left = kPriceAxisCols;
  const int right = std::min(left + graph_width, terminal_width);
  std::string line(left, ' ');

  for (size_t idx : picks) {
    std::string label = format_time_label(s.timestamps[idx], granularity);
    const int len = static_cast<int>(label.size());
    const int x = left + static_cast<int>((idx * static_cast<size_t>(graph_width)) / n);
    const int start = std::max(left, x - len / 2);
    const int end = start + len;
    if (end > right) continue;
    if (static_cast<int>(line.size()) < end) line.resize(end, ' ');
    line.replace(start, len, label);
  }
  if (static_cast<int>(line.size()) > terminal_width) line.resize(std::max(0, terminal_width));
  return line;
}

std::string footer_line(const model::RenderConfig& cfg, const Environment& env) {
  std::string f = std::string("Format: ") + model::to_string(cfg.style);
  if (cfg.style == model::ChartStyle::Dot)
    f += std::string(" (showing: ") + model::to_string(cfg.dot_values) + ")";
  f += std::string(" | Unicode: ") + (env.use_unicode ? "true" : "false");
  f += std::string(" | Color: ") + (env.use_color ? "true" : "false");
  return truncate_ellipsis(f, env.width);
}

std::string compose_chart(const model::PriceSeries& s, const model::RenderConfig& cfg,
                          const Environment& env, const chart::Canvas& canvas,
                          const model::PriceBounds& bounds) {
  const auto& glyphs = chart::glyphs_for(env.use_unicode);
  std::vector<std::string> lines = legend_lines(s, cfg, env.width);
  for (int r = 0; r < canvas.rows(); ++r)
    lines.push_back(canvas_line(canvas, r, bounds, glyphs, env.use_color, env.width));
  lines.push_back(axis_line(canvas.cols(), glyphs, env.width));
  if (auto labels = time_label_line(s, cfg.time_interval, canvas.cols(), env.width); !labels.empty())
    lines.push_back(labels);
  lines.emplace_back();
  lines.push_back(footer_line(cfg, env));

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

std::string render_chart(const model::PriceSeries& s, const model::RenderConfig& cfg,
                         const Environment& env) {
  const CanvasPlan plan = plan_canvas(cfg.width, cfg.height, env.width, env.height);
  const auto bounds = chart::compute_bounds(s);
  chart::Canvas canvas(plan.graph_height, plan.graph_width);
  auto renderer = chart::make_renderer(cfg.style, cfg.dot_values,
                                       chart::glyphs_for(env.use_unicode), env.use_color);
  renderer->paint(s, bounds, canvas);
  return compose_chart(s, cfg, env, canvas, bounds);
}

} // namespace tickplot::ui
