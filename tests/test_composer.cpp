#include "minitest.hpp"
#include "ui/Composer.hpp"
#include "ui/Formatting.hpp"
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

using namespace tickplot;

static constexpr int64_t kJan1 = 1704067200000LL;  // 2024-01-01 00:00 UTC
static constexpr int64_t kDayMs = 86400000LL;

static void use_utc() {
  ::setenv("TZ", "UTC", 1);
  ::tzset();
}

static model::PriceSeries three_days() {
  model::PriceSeries s;
  s.append(kJan1, 10, 16, 9, 15);
  s.append(kJan1 + kDayMs, 20, 21, 9, 10);
  s.append(kJan1 + 2 * kDayMs, 15, 21, 14, 20);
  return s;
}

static model::PriceSeries ramp(int n) {
  model::PriceSeries s;
  for (int i = 0; i < n; ++i) {
    double o = 1000.0 + i * 3.5;
    s.append(kJan1 + i * kDayMs, o, o + 12.0, o - 9.0, (i % 2) ? o - 4.0 : o + 6.0);
  }
  return s;
}

static std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

static ui::Environment plain_env(int w, int h) {
  ui::Environment e;
  e.width = w;
  e.height = h;
  e.use_unicode = false;
  e.use_color = false;
  return e;
}

TEST(legend_has_pair_interval_and_range) {
  use_utc();
  model::RenderConfig cfg;
  auto lines = ui::legend_lines(three_days(), cfg, 120);
  ASSERT_EQ(lines.size(), static_cast<size_t>(3));
  ASSERT_EQ(lines[0], "BTC/USDT - 1d - 3 periods (2024-01-01 00:00 to 2024-01-03 00:00)");
  ASSERT_EQ(lines[1], std::string(lines[0].size(), '='));
  ASSERT_EQ(lines[2], "");
}

TEST(legend_reports_requested_periods) {
  use_utc();
  model::RenderConfig cfg;
  cfg.periods = 50;
  auto lines = ui::legend_lines(three_days(), cfg, 120);
  ASSERT_TRUE(lines[0].find(" - 50 periods (") != std::string::npos);
}

TEST(legend_truncates_with_ellipsis) {
  use_utc();
  model::RenderConfig cfg;
  auto lines = ui::legend_lines(three_days(), cfg, 20);
  ASSERT_EQ(lines[0], "BTC/USDT - 1d - 3...");
  ASSERT_EQ(lines[1], std::string(20, '='));
}

TEST(legend_empty_series) {
  model::RenderConfig cfg;
  auto lines = ui::legend_lines(model::PriceSeries{}, cfg, 80);
  ASSERT_EQ(lines[0], "BTC/USDT - 1d - 0 periods (no data)");
}

TEST(canvas_line_label_separator_and_cells) {
  chart::Canvas c(10, 8);
  c.set(0, 2, chart::Cell{"#", chart::Tone::Bullish});
  model::PriceBounds b{0.0, 90.0};
  auto line = ui::canvas_line(c, 0, b, chart::ascii_glyphs(), false, 80);
  ASSERT_EQ(line, "     90.00|  #     ");
  auto last = ui::canvas_line(c, 9, b, chart::ascii_glyphs(), false, 80);
  ASSERT_EQ(last, "         0|        ");
}

TEST(canvas_line_clips_to_terminal) {
  chart::Canvas c(4, 30);
  for (int x = 0; x < 30; ++x) c.set(1, x, chart::Cell{"#", chart::Tone::Bearish});
  model::PriceBounds b{1000.0, 4000.0};
  auto plain = ui::canvas_line(c, 1, b, chart::ascii_glyphs(), false, 15);
  ASSERT_EQ(plain, "     3,000|####");
  auto colored = ui::canvas_line(c, 1, b, chart::ascii_glyphs(), true, 15);
  ASSERT_EQ(ui::display_cols(colored), 15);
  ASSERT_TRUE(colored.find("\x1B[91m#\x1B[0m") != std::string::npos);
}

TEST(axis_line_corner_and_rule) {
  ASSERT_EQ(ui::axis_line(5, chart::ascii_glyphs(), 80), "          +-----");
  ASSERT_EQ(ui::axis_line(5, chart::unicode_glyphs(), 80), "          └─────");
  ASSERT_EQ(ui::display_cols(ui::axis_line(100, chart::ascii_glyphs(), 40)), 40);
}

TEST(time_labels_three_picks) {
  use_utc();
  auto line = ui::time_label_line(three_days(), "1d", 30, 80);
  ASSERT_EQ(line, std::string(11, ' ') + "01/01" + "   " + "01/02" + "     " + "01/03");
}

TEST(time_labels_hidden_on_narrow_canvas) {
  ASSERT_EQ(ui::time_label_line(three_days(), "1d", 20, 80), "");
  ASSERT_EQ(ui::time_label_line(model::PriceSeries{}, "1d", 60, 80), "");
}

TEST(time_labels_hourly_format) {
  use_utc();
  model::PriceSeries s;
  s.append(kJan1 + 3600000LL * 5, 1, 1, 1, 1);
  s.append(kJan1 + 3600000LL * 6, 1, 1, 1, 1);
  auto line = ui::time_label_line(s, "1h", 60, 120);
  ASSERT_TRUE(line.find("01/01 05:00") != std::string::npos);
}

TEST(footer_line_variants) {
  model::RenderConfig cfg;
  ASSERT_EQ(ui::footer_line(cfg, plain_env(80, 24)), "Format: candle | Unicode: false | Color: false");
  cfg.style = model::ChartStyle::Dot;
  cfg.dot_values = model::DotValues::Close;
  ui::Environment env = plain_env(80, 24);
  env.use_unicode = true;
  env.use_color = true;
  ASSERT_EQ(ui::footer_line(cfg, env), "Format: dot (showing: close) | Unicode: true | Color: true");
}

TEST(render_chart_line_structure) {
  use_utc();
  model::RenderConfig cfg;
  auto out = ui::render_chart(ramp(20), cfg, plain_env(80, 24));
  ASSERT_TRUE(out.empty() || out.back() != '\n');
  auto lines = split_lines(out);
  // legend(3) + 20 rows + axis + labels + blank + footer
  ASSERT_EQ(lines.size(), static_cast<size_t>(27));
  ASSERT_EQ(lines[25], "");
  ASSERT_EQ(lines[26], "Format: candle | Unicode: false | Color: false");
}

TEST(render_chart_stays_within_terminal_width) {
  use_utc();
  model::RenderConfig cfg;
  cfg.width = 200;
  for (int tw : {40, 63, 100}) {
    auto out = ui::render_chart(ramp(60), cfg, plain_env(tw, 30));
    for (const auto& line : split_lines(out)) ASSERT_TRUE(ui::display_cols(line) <= tw);
  }
}

TEST(render_chart_no_escapes_without_color) {
  use_utc();
  model::RenderConfig cfg;
  auto env = plain_env(80, 24);
  env.use_unicode = true;
  ASSERT_TRUE(ui::render_chart(ramp(30), cfg, env).find('\x1B') == std::string::npos);
  cfg.style = model::ChartStyle::Dot;
  ASSERT_TRUE(ui::render_chart(ramp(30), cfg, env).find('\x1B') == std::string::npos);
}

TEST(render_chart_colors_bodies) {
  use_utc();
  model::RenderConfig cfg;
  auto env = plain_env(80, 24);
  env.use_color = true;
  auto out = ui::render_chart(ramp(30), cfg, env);
  ASSERT_TRUE(out.find("\x1B[92m") != std::string::npos);
  ASSERT_TRUE(out.find("\x1B[91m") != std::string::npos);
}

TEST(render_chart_is_deterministic) {
  use_utc();
  model::RenderConfig cfg;
  cfg.style = model::ChartStyle::Dot;
  auto env = plain_env(90, 30);
  env.use_color = true;
  env.use_unicode = true;
  auto s = ramp(45);
  ASSERT_EQ(ui::render_chart(s, cfg, env), ui::render_chart(s, cfg, env));
}

TEST(render_chart_empty_series_blank_canvas) {
  model::RenderConfig cfg;
  auto out = ui::render_chart(model::PriceSeries{}, cfg, plain_env(60, 12));
  auto lines = split_lines(out);
  ASSERT_TRUE(lines[0].find("(no data)") != std::string::npos);
  // legend(3) + 8 rows + axis + blank + footer, no label line
  ASSERT_EQ(lines.size(), static_cast<size_t>(14));
  for (size_t i = 3; i < 11; ++i) ASSERT_EQ(lines[i].substr(11), std::string(lines[i].size() - 11, ' '));
}

TEST(render_chart_single_point) {
  use_utc();
  model::PriceSeries s;
  s.append(kJan1, 0.5, 0.75, 0.25, 0.6);
  model::RenderConfig cfg;
  auto out = ui::render_chart(s, cfg, plain_env(80, 24));
  ASSERT_TRUE(out.find('#') != std::string::npos);
}

static model::PriceSeries hourly(int n) {
  model::PriceSeries s;
  for (int i = 0; i < n; ++i) s.append(kJan1 + i * 3600000LL, 1, 1, 1, 1);
  return s;
}

TEST(time_labels_stop_at_canvas_end_on_wide_terminal) {
  use_utc();
  // picks 0, 5, 9; the last one would end at column 53, past 11 + 40
  auto line = ui::time_label_line(hourly(10), "1h", 40, 200);
  ASSERT_TRUE(static_cast<int>(line.size()) <= 11 + 40);
  ASSERT_EQ(line, std::string(11, ' ') + "01/01 00:00" + "    " + "01/01 05:00");
  ASSERT_TRUE(line.find("01/01 09:00") == std::string::npos);
}

TEST(time_labels_stop_at_terminal_edge) {
  use_utc();
  auto line = ui::time_label_line(hourly(10), "1h", 40, 36);
  ASSERT_EQ(line, std::string(11, ' ') + "01/01 00:00");
}

TEST(canvas_line_huge_prices_keep_separator_column) {
  chart::Canvas c(5, 6);
  model::PriceBounds b{5e10, 6.1e10};
  for (int r = 0; r < c.rows(); ++r) {
    auto line = ui::canvas_line(c, r, b, chart::ascii_glyphs(), false, 80);
    ASSERT_EQ(line.substr(10, 1), "|");
    ASSERT_EQ(ui::display_cols(line), 17);
  }
  ASSERT_EQ(ui::canvas_line(c, 0, b, chart::ascii_glyphs(), false, 80), "    61.00B|      ");
}
