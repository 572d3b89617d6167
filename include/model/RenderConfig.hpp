#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace tickplot::model {

enum class ChartStyle { Candle, Dot };
enum class DotValues { All, High, Low, Close };
// auto|true|false switches for capability overrides
enum class Toggle { Auto, On, Off };

// Settings resolved once before rendering.
struct RenderConfig {
  std::string base_currency{"BTC"};
  std::string quote_currency{"USDT"};
  std::string time_interval{"1d"};
  ChartStyle style{ChartStyle::Candle};
  DotValues dot_values{DotValues::All};
  std::optional<int> width;
  std::optional<int> height;
  Toggle use_unicode{Toggle::Auto};
  Toggle use_color{Toggle::Auto};
  std::optional<int> periods;
};

[[nodiscard]] std::optional<ChartStyle> parse_chart_style(std::string_view s);
[[nodiscard]] std::optional<DotValues> parse_dot_values(std::string_view s);
[[nodiscard]] std::optional<Toggle> parse_toggle(std::string_view s);

[[nodiscard]] const char* to_string(ChartStyle s);
[[nodiscard]] const char* to_string(DotValues v);
[[nodiscard]] const char* to_string(Toggle t);

} // namespace tickplot::model
