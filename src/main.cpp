#include "app/Config.hpp"
#include "model/RenderConfig.hpp"
#include "provider/BinanceProvider.hpp"
#include "ui/Composer.hpp"
#include "ui/Layout.hpp"
#include "ui/Terminal.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int kExitValidation = 1;
constexpr int kExitUnexpected = 2;

int fail(int code, const char* label, const std::string& msg) {
  std::fflush(stdout);
  std::fprintf(stderr, "tickplot: %s: %s\n", label, msg.c_str());
  return code;
}

} // namespace

int main(int argc, char** argv) {
  using namespace tickplot;
  try {
    app::AppConfig cfg = app::load_app_config(argc, argv);
    if (cfg.help) {
      std::cout << app::usage_text();
      return 0;
    }

    const ui::TermFacts facts = ui::probe_terminal_facts();
    // Width and height settings size the canvas, not the terminal.
    ui::EnvOverrides overrides;
    overrides.unicode = cfg.render.use_unicode;
    overrides.color = cfg.render.use_color;
    const ui::Environment env = ui::resolve_environment(overrides, facts);

    const ui::CanvasPlan plan = ui::plan_canvas(cfg.render.width, cfg.render.height, env.width, env.height);
    if (!cfg.render.periods) cfg.render.periods = ui::plan_periods(plan.graph_width, cfg.render.style);

    provider::KlineRequest req;
    req.base_currency = cfg.render.base_currency;
    req.quote_currency = cfg.render.quote_currency;
    req.interval = cfg.render.time_interval;
    req.periods = *cfg.render.periods;

    if (!cfg.quiet) {
      std::fprintf(stderr, "tickplot: fetching %d periods of %s/%s (%s)...\n", req.periods,
                   req.base_currency.c_str(), req.quote_currency.c_str(), req.interval.c_str());
    }

    provider::BinanceProvider binance;
    const model::PriceSeries series = binance.fetch(req);
    std::cout << ui::render_chart(series, cfg.render, env) << "\n";
    std::cout.flush();
    return 0;
  } catch (const app::ConfigError& ex) {
    return fail(kExitValidation, "error", ex.what());
  } catch (const provider::ProviderError& ex) {
    if (ex.is_validation()) return fail(kExitValidation, "error", ex.what());
    return fail(kExitUnexpected, "unexpected error", ex.what());
  } catch (const std::exception& ex) {
    return fail(kExitUnexpected, "unexpected error", ex.what());
  }
}
