#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include <cstdlib>
#include <ctime>
#include <limits>

using namespace tickplot;

TEST(format_price_large_values_grouped) {
  ASSERT_EQ(ui::format_price(43250.7), "43,251");
  ASSERT_EQ(ui::format_price(1000.0), "1,000");
  ASSERT_EQ(ui::format_price(1234567.0), "1,234,567");
}

TEST(format_price_two_decimals_above_one) {
  ASSERT_EQ(ui::format_price(12.5), "12.50");
  ASSERT_EQ(ui::format_price(1.0), "1.00");
  ASSERT_EQ(ui::format_price(999.25), "999.25");
}

TEST(format_price_small_values_trimmed) {
  ASSERT_EQ(ui::format_price(0.5), "0.5");
  ASSERT_EQ(ui::format_price(0.00012345), "0.000123");
  ASSERT_EQ(ui::format_price(0.0), "0");
  ASSERT_EQ(ui::format_price(-0.0000001), "0");
  ASSERT_EQ(ui::format_price(std::numeric_limits<double>::quiet_NaN()), "-");
}

TEST(group_thousands_variants) {
  ASSERT_EQ(ui::group_thousands("123"), "123");
  ASSERT_EQ(ui::group_thousands("1234567.89"), "1,234,567.89");
  ASSERT_EQ(ui::group_thousands("-1234"), "-1,234");
  ASSERT_EQ(ui::group_thousands("123456"), "123,456");
}

TEST(display_cols_skips_sgr) {
  ASSERT_EQ(ui::display_cols("abc"), 3);
  ASSERT_EQ(ui::display_cols("\x1B[92m█\x1B[0m"), 1);
  ASSERT_EQ(ui::display_cols("│─└"), 3);
  ASSERT_EQ(ui::take_cols("│││", 2), "││");
}

TEST(fit_helpers) {
  ASSERT_EQ(ui::rjust("ab", 5), "   ab");
  ASSERT_EQ(ui::rjust("abcdef", 3), "abcdef");
  ASSERT_EQ(ui::truncate_ellipsis("abcdef", 5), "ab...");
  ASSERT_EQ(ui::truncate_ellipsis("abcdef", 3), "abc");
  ASSERT_EQ(ui::truncate_ellipsis("abc", 3), "abc");
  ASSERT_EQ(ui::truncate_ellipsis("abc", 0), "");
  ASSERT_EQ(ui::repeat("─", 3), "───");
  ASSERT_EQ(ui::repeat("-", 0), "");
}

TEST(time_labels_by_granularity) {
  ::setenv("TZ", "UTC", 1);
  ::tzset();
  const int64_t t = 1704085200000LL;  // 2024-01-01 05:00 UTC
  ASSERT_EQ(ui::format_time_label(t, model::Granularity::Day), "01/01");
  ASSERT_EQ(ui::format_time_label(t, model::Granularity::Month), "01/01");
  ASSERT_EQ(ui::format_time_label(t, model::Granularity::Hour), "01/01 05:00");
  ASSERT_EQ(ui::format_time_label(t, model::Granularity::Minute), "05:00");
  ASSERT_EQ(ui::format_timestamp(t, "%Y-%m-%d %H:%M"), "2024-01-01 05:00");
}

TEST(price_label_fits_width) {
  ASSERT_EQ(ui::format_price_label(12345.0, 10), "12,345");
  ASSERT_EQ(ui::format_price_label(61e9, 10), "61.00B");
  ASSERT_EQ(ui::format_price_label(1234567890.0, 10), "1.23B");
  ASSERT_EQ(ui::format_price_label(1e20, 10), "100000000T");
  ASSERT_EQ(ui::format_price_label(1e25, 10), "1.000e+25");
  for (double p : {0.000123, 7.5, 999999.0, 4.2e11, 9.9e30})
    ASSERT_TRUE(ui::display_cols(ui::format_price_label(p, 10)) <= 10);
}
