#pragma once

#include "model/Interval.hpp"
#include <cstdint>
#include <string>

namespace tickplot::ui {

// UTF-8 text width utilities (one column per code point, SGR skipped)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text fitting
std::string rjust(const std::string& s, int w);
std::string truncate_ellipsis(const std::string& s, int w);
std::string repeat(const std::string& glyph, int n);

// Price labels: >= 1000 "12,345"; >= 1 "1,234.57"; below 1 up to six
// decimals with trailing zeros removed.
std::string format_price(double price);
std::string group_thousands(const std::string& digits);
// format_price squeezed into `width` columns: K/M/B/T suffixes first, then
// exponent notation.
std::string format_price_label(double price, int width);

// Local-time formatting of epoch milliseconds
std::string format_timestamp(int64_t epoch_ms, const char* fmt);
// Axis label: MM/DD for day/week/month, "MM/DD HH:MM" for hours, HH:MM below
std::string format_time_label(int64_t epoch_ms, model::Granularity g);

} // namespace tickplot::ui
