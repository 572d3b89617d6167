#pragma once

#include <string>

namespace tickplot::net {

struct HttpResponse {
  unsigned status{0};
  std::string body;
  std::string final_host;
  std::string final_target;
};

// Blocking HTTPS GET with SNI, following up to five same-scheme redirects.
// Throws std::runtime_error on DNS, connect, TLS or read failures; HTTP
// error statuses are returned, not thrown.
HttpResponse https_get(const std::string& host, const std::string& target, int timeout_sec = 20);

} // namespace tickplot::net
