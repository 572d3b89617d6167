#pragma once

namespace tickplot::util {

// Locale-independent ASCII lowercase.
constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

} // namespace tickplot::util
