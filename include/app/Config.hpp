#pragma once

#include "model/RenderConfig.hpp"
#include "util/TomlReader.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace tickplot::app {

// Bad flag, missing value, unknown enum token, non-positive size...
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Flags as given on the command line, keyed by settings name
// ("base_currency", "width", ...).
struct CliOptions {
  std::unordered_map<std::string, std::string> values;
  std::optional<std::string> config_path;
  bool quiet{false};
  bool help{false};
};

struct AppConfig {
  model::RenderConfig render;
  std::string config_path;  // file actually read, empty if none
  bool quiet{false};
  bool help{false};
};

[[nodiscard]] CliOptions parse_cli(int argc, const char* const* argv);

// Per key: CLI -> TOML -> environment -> compiled default.
[[nodiscard]] model::RenderConfig resolve_render_config(const CliOptions& cli,
                                                        const util::TomlReader* toml);

// parse_cli + config file discovery + resolve_render_config.
[[nodiscard]] AppConfig load_app_config(int argc, const char* const* argv);

[[nodiscard]] std::string default_config_path();
[[nodiscard]] std::string usage_text();

// Environment variable helpers (TICKPLOT_ or tickplot_ prefix)
const char* getenv_compat(const char* name);

} // namespace tickplot::app
