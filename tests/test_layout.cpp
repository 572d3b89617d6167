#include "minitest.hpp"
#include "ui/Layout.hpp"

using namespace tickplot;
using ui::plan_canvas;
using ui::plan_periods;

TEST(layout_auto_size_leaves_label_margin) {
  auto p = plan_canvas(std::nullopt, std::nullopt, 80, 24);
  ASSERT_EQ(p.graph_width, 59);
  ASSERT_EQ(p.graph_height, 20);
}

TEST(layout_explicit_size_counts_price_axis) {
  auto p = plan_canvas(50, 15, 80, 24);
  ASSERT_EQ(p.graph_width, 39);
  ASSERT_EQ(p.graph_height, 11);
}

TEST(layout_explicit_size_clamped_to_terminal) {
  auto p = plan_canvas(500, 100, 80, 24);
  ASSERT_EQ(p.graph_width, 69);
  ASSERT_EQ(p.graph_height, 20);
}

TEST(layout_minimums_win_on_tiny_terminals) {
  auto p = plan_canvas(std::nullopt, std::nullopt, 20, 6);
  ASSERT_EQ(p.graph_width, 20);
  ASSERT_EQ(p.graph_height, 5);
  auto q = plan_canvas(5, 2, 200, 60);
  ASSERT_EQ(q.graph_width, 20);
  ASSERT_EQ(q.graph_height, 5);
}

TEST(periods_follow_style_density) {
  ASSERT_EQ(plan_periods(59, model::ChartStyle::Candle), 29);
  ASSERT_EQ(plan_periods(59, model::ChartStyle::Dot), 39);
  ASSERT_EQ(plan_periods(60, model::ChartStyle::Dot), 40);
}

TEST(periods_clamped) {
  ASSERT_EQ(plan_periods(10, model::ChartStyle::Candle), 10);
  ASSERT_EQ(plan_periods(0, model::ChartStyle::Dot), 10);
  ASSERT_EQ(plan_periods(5000, model::ChartStyle::Dot), 1000);
  ASSERT_EQ(plan_periods(2000, model::ChartStyle::Candle), 1000);
}
