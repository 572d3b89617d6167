#pragma once

#include "model/RenderConfig.hpp"
#include <optional>
#include <string>

namespace tickplot::ui {

constexpr int kDefaultCols = 80;
constexpr int kDefaultRows = 20;

// Raw observations about the output terminal. Gathered once by
// probe_terminal_facts(); everything downstream is a pure function of it.
struct TermFacts {
  std::optional<int> env_columns;  // COLUMNS, if a positive integer
  std::optional<int> env_lines;    // LINES, if a positive integer
  std::optional<int> ioctl_cols;   // TIOCGWINSZ on stdout
  std::optional<int> ioctl_rows;
  bool stdout_tty{false};
  std::string codeset;             // nl_langinfo(CODESET), e.g. "UTF-8"
  bool no_color{false};            // NO_COLOR present and non-empty
  std::string term;                // TERM
};

struct EnvOverrides {
  std::optional<int> width;
  std::optional<int> height;
  model::Toggle unicode{model::Toggle::Auto};
  model::Toggle color{model::Toggle::Auto};
};

struct Environment {
  int width{kDefaultCols};
  int height{kDefaultRows};
  bool use_unicode{false};
  bool use_color{false};
};

// Terminal capability detection
[[nodiscard]] TermFacts probe_terminal_facts();
[[nodiscard]] bool tty_stdout();
[[nodiscard]] int term_cols(const TermFacts& f);
[[nodiscard]] int term_rows(const TermFacts& f);

// True when U+2502 (box drawing vertical) converts into the codeset.
[[nodiscard]] bool codeset_encodes_box_drawing(const std::string& codeset);
[[nodiscard]] bool detect_unicode(const TermFacts& f);
[[nodiscard]] bool detect_color(const TermFacts& f);

[[nodiscard]] Environment resolve_environment(const EnvOverrides& o, const TermFacts& f);

// SGR code generation
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();

} // namespace tickplot::ui
