#include "ui/Formatting.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>

namespace tickplot::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string rjust(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return std::string(w - cols, ' ') + s;
}

std::string truncate_ellipsis(const std::string& s, int w) {
  if (w <= 0) return "";
  if (display_cols(s) <= w) return s;
  if (w <= 3) return take_cols(s, w);
  return take_cols(s, w - 3) + "...";
}

std::string repeat(const std::string& glyph, int n) {
  std::string r;
  if (n <= 0) return r;
  r.reserve(glyph.size() * n);
  for (int i = 0; i < n; ++i) r += glyph;
  return r;
}

std::string group_thousands(const std::string& digits) {
  size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
  size_t dot = digits.find('.');
  size_t int_end = (dot == std::string::npos) ? digits.size() : dot;
  std::string out = digits.substr(0, start);
  size_t n = int_end - start;
  for (size_t i = 0; i < n; ++i) {
    out += digits[start + i];
    size_t left = n - i - 1;
    if (left > 0 && left % 3 == 0) out += ',';
  }
  out += digits.substr(int_end);
  return out;
}

std::string format_price(double price) {
  if (!std::isfinite(price)) return "-";
  char buf[64];
  if (price >= 1000.0) {
    std::snprintf(buf, sizeof(buf), "%.0f", price);
    return group_thousands(buf);
  }
  if (price >= 1.0) {
    std::snprintf(buf, sizeof(buf), "%.2f", price);
    return group_thousands(buf);
  }
  std::snprintf(buf, sizeof(buf), "%.6f", price);
  std::string s = buf;
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s == "-0" || s.empty()) s = "0";
  return s;
}

std::string format_price_label(double price, int width) {
  std::string s = format_price(price);
  if (display_cols(s) <= width) return s;

  struct Unit { double scale; const char* suffix; };
  static constexpr Unit kUnits[] = {{1e12, "T"}, {1e9, "B"}, {1e6, "M"}, {1e3, "K"}};
  char buf[64];
  for (const auto& u : kUnits) {
    if (std::fabs(price) < u.scale) continue;
    for (int decimals = 2; decimals >= 0; --decimals) {
      std::snprintf(buf, sizeof(buf), "%.*f%s", decimals, price / u.scale, u.suffix);
      if (display_cols(buf) <= width) return buf;
    }
    break;
  }
  for (int digits = 3; digits >= 0; --digits) {
    std::snprintf(buf, sizeof(buf), "%.*e", digits, price);
    if (display_cols(buf) <= width) return buf;
  }
  return take_cols(s, width);
}

std::string format_timestamp(int64_t epoch_ms, const char* fmt) {
  std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm lt{};
  if (!localtime_r(&t, &lt)) return std::string();
  char buf[64];
  if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return std::string();
  return std::string(buf);
}

std::string format_time_label(int64_t epoch_ms, model::Granularity g) {
  using model::Granularity;
  switch (g) {
    case Granularity::Day:
    case Granularity::Week:
    case Granularity::Month:
      return format_timestamp(epoch_ms, "%m/%d");
    case Granularity::Hour:
      return format_timestamp(epoch_ms, "%m/%d %H:%M");
    case Granularity::Minute:
      break;
  }
  return format_timestamp(epoch_ms, "%H:%M");
}

} // namespace tickplot::ui
