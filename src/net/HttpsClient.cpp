#include "net/HttpsClient.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

namespace tickplot::net {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

std::runtime_error make_error(const std::string& host, const std::string& target, const std::string& msg) {
  return std::runtime_error("GET https://" + host + target + " failed: " + msg);
}

struct Location {
  std::string host;
  std::string target;
};

// Absolute https:// or host-relative Location header.
Location parse_location(const std::string& location, const std::string& current_host) {
  if (location.empty()) throw std::runtime_error("redirect without Location header");
  Location out;
  if (location.rfind("https://", 0) == 0) {
    std::string rest = location.substr(8);
    auto slash = rest.find('/');
    std::string host = rest.substr(0, slash);
    if (auto colon = host.find(':'); colon != std::string::npos) {
      if (host.substr(colon + 1) != "443")
        throw std::runtime_error("redirect to unsupported port: " + host.substr(colon + 1));
      host.resize(colon);
    }
    if (host.empty()) throw std::runtime_error("redirect URL without host");
    out.host = host;
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
  } else if (location.rfind("http://", 0) == 0) {
    throw std::runtime_error("refusing redirect to plain HTTP");
  } else {
    out.host = current_host;
    out.target = (location.front() == '/') ? location : "/" + location;
  }
  return out;
}

http::response<http::string_body> request_once(const std::string& host, const std::string& target,
                                               int timeout_sec) {
  asio::io_context ioc;
  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  ssl::stream<beast::tcp_stream> stream(ioc, ctx);
  stream.set_verify_callback(ssl::host_name_verification(host));
  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    unsigned long err = ::ERR_get_error();
    const char* reason = err ? ::ERR_reason_error_string(err) : nullptr;
    throw make_error(host, target, std::string("cannot set SNI host") + (reason ? std::string(": ") + reason : ""));
  }

  beast::error_code ec;
  asio::ip::tcp::resolver resolver(ioc);
  auto const results = resolver.resolve(host, "443", ec);
  if (ec) throw make_error(host, target, "DNS resolution: " + ec.message());

  auto& tcp = beast::get_lowest_layer(stream);
  tcp.expires_after(std::chrono::seconds(timeout_sec));
  tcp.connect(results, ec);
  if (ec) throw make_error(host, target, "connect: " + ec.message());

  tcp.expires_after(std::chrono::seconds(timeout_sec));
  stream.handshake(ssl::stream_base::client, ec);
  if (ec) throw make_error(host, target, "TLS handshake: " + ec.message());

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "tickplot/1.0");
  req.set(http::field::accept, "application/json");
  req.set(http::field::connection, "close");

  tcp.expires_after(std::chrono::seconds(timeout_sec));
  http::write(stream, req, ec);
  if (ec) throw make_error(host, target, "write: " + ec.message());

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res, ec);
  if (ec) throw make_error(host, target, "read: " + ec.message());

  // Servers commonly close without a TLS close_notify; the body is complete.
  stream.shutdown(ec);
  if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated)
    throw make_error(host, target, "TLS shutdown: " + ec.message());
  return res;
}

} // namespace

HttpResponse https_get(const std::string& host, const std::string& target, int timeout_sec) {
  if (host.empty()) throw std::runtime_error("https_get: empty host");
  if (timeout_sec <= 0) throw make_error(host, target, "timeout must be positive");

  std::string cur_host = host;
  std::string cur_target = target.empty() ? "/" : target;
  if (cur_target.front() != '/') cur_target.insert(cur_target.begin(), '/');

  for (int hop = 0; hop <= kMaxRedirects; ++hop) {
    auto res = request_once(cur_host, cur_target, timeout_sec);
    const auto status = static_cast<unsigned>(res.result_int());
    if (status == 301U || status == 302U || status == 307U || status == 308U) {
      auto loc = parse_location(std::string(res.base()[http::field::location]), cur_host);
      cur_host = loc.host;
      cur_target = loc.target;
      continue;
    }
    HttpResponse out;
    out.status = status;
    out.body = std::move(res.body());
    out.final_host = cur_host;
    out.final_target = cur_target;
    return out;
  }
  throw make_error(cur_host, cur_target, "too many redirects");
}

} // namespace tickplot::net
