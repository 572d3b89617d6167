#include "model/RenderConfig.hpp"
#include "util/AsciiLower.hpp"
#include <string>

namespace tickplot::model {

static std::string lowered(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = tickplot::util::ascii_lower(static_cast<unsigned char>(c));
  return out;
}

std::optional<ChartStyle> parse_chart_style(std::string_view s) {
  auto v = lowered(s);
  if (v == "candle") return ChartStyle::Candle;
  if (v == "dot") return ChartStyle::Dot;
  return std::nullopt;
}

std::optional<DotValues> parse_dot_values(std::string_view s) {
  auto v = lowered(s);
  if (v == "all") return DotValues::All;
  if (v == "high") return DotValues::High;
  if (v == "low") return DotValues::Low;
  if (v == "close") return DotValues::Close;
  return std::nullopt;
}

std::optional<Toggle> parse_toggle(std::string_view s) {
  auto v = lowered(s);
  if (v == "auto") return Toggle::Auto;
  if (v == "true" || v == "1" || v == "yes" || v == "on") return Toggle::On;
  if (v == "false" || v == "0" || v == "no" || v == "off") return Toggle::Off;
  return std::nullopt;
}

const char* to_string(ChartStyle s) {
  return s == ChartStyle::Dot ? "dot" : "candle";
}

const char* to_string(DotValues v) {
  switch (v) {
    case DotValues::High:  return "high";
    case DotValues::Low:   return "low";
    case DotValues::Close: return "close";
    case DotValues::All:   break;
  }
  return "all";
}

const char* to_string(Toggle t) {
  switch (t) {
    case Toggle::On:   return "true";
    case Toggle::Off:  return "false";
    case Toggle::Auto: break;
  }
  return "auto";
}

} // namespace tickplot::model
