#include "app/Config.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace tickplot::app {

// One row per setting: CLI flag, TOML section/key, environment variable.
struct SettingDef { const char* flag; const char* section; const char* key; const char* env; };
static constexpr SettingDef kSettings[] = {
  {"--base-currency",  "market", "base_currency",  "TICKPLOT_BASE_CURRENCY"},
  {"--quote-currency", "market", "quote_currency", "TICKPLOT_QUOTE_CURRENCY"},
  {"--time-interval",  "market", "time_interval",  "TICKPLOT_TIME_INTERVAL"},
  {"--periods",        "market", "periods",        "TICKPLOT_PERIODS"},
  {"--graph-format",   "chart",  "graph_format",   "TICKPLOT_GRAPH_FORMAT"},
  {"--dot-values",     "chart",  "dot_values",     "TICKPLOT_DOT_VALUES"},
  {"--width",          "chart",  "width",          "TICKPLOT_WIDTH"},
  {"--height",         "chart",  "height",         "TICKPLOT_HEIGHT"},
  {"--use-unicode",    "chart",  "use_unicode",    "TICKPLOT_USE_UNICODE"},
  {"--use-color",      "chart",  "use_color",      "TICKPLOT_USE_COLOR"},
};

static const SettingDef& setting(std::string_view key) {
  for (const auto& s : kSettings)
    if (key == s.key) return s;
  throw std::logic_error("unknown setting " + std::string(key));
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TICKPLOT_", 0) == 0) {
    alt = std::string("tickplot_") + n.substr(9);
  } else if (n.rfind("tickplot_", 0) == 0) {
    alt = std::string("TICKPLOT_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string default_config_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tickplot/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tickplot/config.toml";
  return {};
}

std::string usage_text() {
  return
    "Usage: tickplot [options]\n"
    "  --base-currency SYM        base asset (default BTC)\n"
    "  --quote-currency SYM       quote asset (default USDT)\n"
    "  --time-interval TOK        1m 3m 5m 15m 30m 1h 2h 4h 6h 8h 12h 1d 3d 1w 1M (default 1d)\n"
    "  --periods N                periods to fetch (default: fit to width)\n"
    "  --graph-format FMT         candle | dot\n"
    "  --dot-values SEL           all | high | low | close (dot format)\n"
    "  --width N / --height N     chart size in characters / lines\n"
    "  --use-unicode MODE         auto | true | false\n"
    "  --use-color MODE           auto | true | false\n"
    "  -f, --config PATH          TOML settings file\n"
    "  -q, --quiet                no progress line on stderr\n"
    "  -h, --help                 show this help\n";
}

CliOptions parse_cli(int argc, const char* const* argv) {
  CliOptions out;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { out.help = true; continue; }
    if (a == "-q" || a == "--quiet") { out.quiet = true; continue; }

    std::string flag = a, value;
    bool inline_value = false;
    if (auto eq = a.find('='); a.rfind("--", 0) == 0 && eq != std::string::npos) {
      flag = a.substr(0, eq);
      value = a.substr(eq + 1);
      inline_value = true;
    }
    auto take_value = [&]() -> std::string {
      if (inline_value) return value;
      if (i + 1 >= argc) throw ConfigError("missing value for " + flag);
      return argv[++i];
    };

    if (flag == "-f" || flag == "--config") { out.config_path = take_value(); continue; }
    bool known = false;
    for (const auto& s : kSettings) {
      if (flag == s.flag) {
        out.values[s.key] = take_value();
        known = true;
        break;
      }
    }
    if (!known) throw ConfigError("unknown option: " + a);
  }
  return out;
}

static std::optional<std::string> lookup(std::string_view key, const CliOptions& cli,
                                         const util::TomlReader* toml) {
  const auto& s = setting(key);
  if (auto it = cli.values.find(s.key); it != cli.values.end()) return it->second;
  if (toml) {
    if (auto v = toml->find(s.section, s.key)) return v;
  }
  if (const char* v = getenv_compat(s.env)) return std::string(v);
  return std::nullopt;
}

// Unset, empty or "auto" -> nullopt; otherwise a positive integer.
static std::optional<int> size_value(std::string_view key, const std::optional<std::string>& v) {
  if (!v || v->empty() || *v == "auto") return std::nullopt;
  const char* b = v->c_str();
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(b, &end, 10);
  if (errno != 0 || end == b || *end != '\0' || n <= 0 || n > 1000000)
    throw ConfigError(std::string(key) + " must be a positive integer, got '" + *v + "'");
  return static_cast<int>(n);
}

static std::string symbol_value(std::string_view key, const std::optional<std::string>& v,
                                const char* def) {
  if (!v) return def;
  if (v->empty()) throw ConfigError(std::string(key) + " must not be empty");
  for (unsigned char c : *v) {
    if (!std::isalnum(c)) throw ConfigError(std::string(key) + " must be alphanumeric, got '" + *v + "'");
  }
  return *v;
}

template <typename T, typename Parser>
static T enum_value(std::string_view key, const std::optional<std::string>& v, T def, Parser parse) {
  if (!v) return def;
  auto parsed = parse(*v);
  if (!parsed) throw ConfigError("invalid " + std::string(key) + ": '" + *v + "'");
  return *parsed;
}

model::RenderConfig resolve_render_config(const CliOptions& cli, const util::TomlReader* toml) {
  model::RenderConfig c;
  auto get = [&](std::string_view key) { return lookup(key, cli, toml); };

  c.base_currency  = symbol_value("base_currency", get("base_currency"), "BTC");
  c.quote_currency = symbol_value("quote_currency", get("quote_currency"), "USDT");
  if (auto v = get("time_interval"); v && !v->empty()) c.time_interval = *v;
  c.periods = size_value("periods", get("periods"));

  c.style       = enum_value("graph_format", get("graph_format"), model::ChartStyle::Candle, model::parse_chart_style);
  c.dot_values  = enum_value("dot_values", get("dot_values"), model::DotValues::All, model::parse_dot_values);
  c.width       = size_value("width", get("width"));
  c.height      = size_value("height", get("height"));
  c.use_unicode = enum_value("use_unicode", get("use_unicode"), model::Toggle::Auto, model::parse_toggle);
  c.use_color   = enum_value("use_color", get("use_color"), model::Toggle::Auto, model::parse_toggle);
  return c;
}

AppConfig load_app_config(int argc, const char* const* argv) {
  AppConfig app;
  CliOptions cli = parse_cli(argc, argv);
  app.quiet = cli.quiet;
  app.help = cli.help;
  if (cli.help) return app;

  util::TomlReader toml;
  bool have_toml = false;
  if (cli.config_path) {
    if (!toml.load(*cli.config_path))
      throw ConfigError("cannot read config file " + *cli.config_path);
    app.config_path = *cli.config_path;
    have_toml = true;
  } else {
    auto path = default_config_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec) && toml.load(path)) {
      app.config_path = path;
      have_toml = true;
    }
  }
  app.render = resolve_render_config(cli, have_toml ? &toml : nullptr);
  return app;
}

} // namespace tickplot::app
