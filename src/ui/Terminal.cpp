#include "ui/Terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <iconv.h>
#include <langinfo.h>
#include <cerrno>
#include <clocale>
#include <cstdlib>
#include <string>

namespace tickplot::ui {

static std::optional<int> env_positive_int(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0' || n <= 0 || n > 100000) return std::nullopt;
  return static_cast<int>(n);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

TermFacts probe_terminal_facts() {
  TermFacts f;
  f.env_columns = env_positive_int("COLUMNS");
  f.env_lines = env_positive_int("LINES");
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
    if (ws.ws_col > 0) f.ioctl_cols = ws.ws_col;
    if (ws.ws_row > 0) f.ioctl_rows = ws.ws_row;
  }
  f.stdout_tty = tty_stdout();
  // Adopt the user's LC_CTYPE so CODESET reflects the terminal, not "C".
  std::setlocale(LC_CTYPE, "");
  if (const char* cs = nl_langinfo(CODESET); cs && *cs) f.codeset = cs;
  const char* nc = std::getenv("NO_COLOR");
  f.no_color = nc && *nc;
  if (const char* t = std::getenv("TERM")) f.term = t;
  return f;
}

int term_cols(const TermFacts& f) {
  if (f.env_columns) return *f.env_columns;
  if (f.ioctl_cols) return *f.ioctl_cols;
  return kDefaultCols;
}

int term_rows(const TermFacts& f) {
  if (f.env_lines) return *f.env_lines;
  if (f.ioctl_rows) return *f.ioctl_rows;
  return kDefaultRows;
}

bool codeset_encodes_box_drawing(const std::string& codeset) {
  if (codeset.empty()) return false;
  iconv_t cd = iconv_open(codeset.c_str(), "UTF-8");
  // iconv_open signals failure with the (iconv_t)-1 sentinel
  if (cd == reinterpret_cast<iconv_t>(-1)) return false;
  char in[] = "\xE2\x94\x82";  // U+2502
  char out[16];
  char* inp = in;
  char* outp = out;
  size_t inleft = 3, outleft = sizeof(out);
  size_t rc = iconv(cd, &inp, &inleft, &outp, &outleft);
  iconv_close(cd);
  return rc != static_cast<size_t>(-1) && inleft == 0;
}

bool detect_unicode(const TermFacts& f) {
  return codeset_encodes_box_drawing(f.codeset);
}

bool detect_color(const TermFacts& f) {
  if (!f.stdout_tty) return false;
  if (f.no_color || f.term == "dumb") return false;
  return true;
}

Environment resolve_environment(const EnvOverrides& o, const TermFacts& f) {
  using model::Toggle;
  Environment e;
  e.width = o.width ? *o.width : term_cols(f);
  e.height = o.height ? *o.height : term_rows(f);
  switch (o.unicode) {
    case Toggle::On:   e.use_unicode = true; break;
    case Toggle::Off:  e.use_unicode = false; break;
    case Toggle::Auto: e.use_unicode = detect_unicode(f); break;
  }
  switch (o.color) {
    case Toggle::On:   e.use_color = true; break;
    case Toggle::Off:  e.use_color = false; break;
    case Toggle::Auto: e.use_color = detect_color(f); break;
  }
  return e;
}

std::string sgr(const char* code) {
  if (!code || !*code) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() {
  return std::string("\x1B[0m");
}

} // namespace tickplot::ui
