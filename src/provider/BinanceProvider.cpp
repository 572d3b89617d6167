#include "provider/BinanceProvider.hpp"
#include "model/Interval.hpp"
#include "net/HttpsClient.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>

#include <boost/json.hpp>

namespace tickplot::provider {

namespace {

constexpr long long kInvalidIntervalCode = -1120;
constexpr long long kInvalidSymbolCode = -1121;

ProviderError payload_error(const std::string& msg) {
  return ProviderError(ProviderErrorKind::UnexpectedProviderFailure, "malformed klines payload: " + msg);
}

int64_t json_to_int64(const boost::json::value& v) {
  if (v.is_int64()) return v.as_int64();
  if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
  if (v.is_double()) return static_cast<int64_t>(std::llround(v.as_double()));
  if (v.is_string()) {
    std::string s(v.as_string().c_str());
    try { return std::stoll(s); } catch (const std::exception& ex) {
      throw payload_error("bad integer '" + s + "': " + ex.what());
    }
  }
  throw payload_error("expected integer");
}

// Binance sends prices as decimal strings to keep precision.
double json_to_double(const boost::json::value& v) {
  double d = 0.0;
  if (v.is_double()) d = v.as_double();
  else if (v.is_int64()) d = static_cast<double>(v.as_int64());
  else if (v.is_uint64()) d = static_cast<double>(v.as_uint64());
  else if (v.is_string()) {
    std::string s(v.as_string().c_str());
    try { d = std::stod(s); } catch (const std::exception& ex) {
      throw payload_error("bad price '" + s + "': " + ex.what());
    }
  } else {
    throw payload_error("expected number");
  }
  if (!std::isfinite(d)) throw payload_error("non-finite price");
  return d;
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

const char* to_string(ProviderErrorKind k) {
  switch (k) {
    case ProviderErrorKind::InvalidInterval: return "invalid interval";
    case ProviderErrorKind::InvalidSymbol:   return "invalid symbol";
    case ProviderErrorKind::EmptySeries:     return "empty series";
    case ProviderErrorKind::UnexpectedProviderFailure: break;
  }
  return "provider failure";
}

model::PriceSeries parse_klines(const std::string& body) {
  boost::json::error_code ec;
  boost::json::value doc = boost::json::parse(body, ec);
  if (ec) throw payload_error(ec.message());
  if (!doc.is_array()) throw payload_error("expected top-level array");

  model::PriceSeries out;
  for (const auto& row_value : doc.as_array()) {
    if (!row_value.is_array()) throw payload_error("expected kline row array");
    const auto& row = row_value.as_array();
    if (row.size() < 5) throw payload_error("kline row has " + std::to_string(row.size()) + " fields");
    const int64_t open_ms = json_to_int64(row.at(0));
    // keep timestamps strictly increasing
    if (!out.timestamps.empty() && open_ms <= out.timestamps.back()) continue;
    out.append(open_ms, json_to_double(row.at(1)), json_to_double(row.at(2)),
               json_to_double(row.at(3)), json_to_double(row.at(4)));
  }
  return out;
}

std::optional<long long> binance_error_code(const std::string& body) {
  boost::json::error_code ec;
  boost::json::value doc = boost::json::parse(body, ec);
  if (ec || !doc.is_object()) return std::nullopt;
  const auto* code = doc.as_object().if_contains("code");
  if (!code) return std::nullopt;
  if (code->is_int64()) return code->as_int64();
  if (code->is_uint64()) return static_cast<long long>(code->as_uint64());
  return std::nullopt;
}

std::string BinanceProvider::klines_target(const std::string& symbol,
                                           const std::string& interval, int limit) {
  std::ostringstream target;
  target << "/api/v3/klines?symbol=" << symbol << "&interval=" << interval
         << "&limit=" << std::clamp(limit, 1, kMaxLimit);
  return target.str();
}

model::PriceSeries BinanceProvider::fetch(const KlineRequest& req) {
  if (!model::parse_interval(req.interval)) {
    std::string valid;
    for (const auto& t : model::valid_interval_tokens()) valid += (valid.empty() ? "" : " ") + t;
    throw ProviderError(ProviderErrorKind::InvalidInterval,
                        "invalid interval '" + req.interval + "' (valid: " + valid + ")");
  }

  const std::string symbol = upper(req.base_currency + req.quote_currency);
  const std::string target = klines_target(symbol, req.interval, req.periods);

  net::HttpResponse res;
  try {
    res = net::https_get(host_, target, timeout_sec_);
  } catch (const std::exception& ex) {
    throw ProviderError(ProviderErrorKind::UnexpectedProviderFailure, ex.what());
  }

  if (res.status != 200U) {
    auto code = binance_error_code(res.body);
    if (res.status == 400U && code && *code == kInvalidSymbolCode)
      throw ProviderError(ProviderErrorKind::InvalidSymbol, "invalid symbol '" + symbol + "'");
    if (res.status == 400U && code && *code == kInvalidIntervalCode)
      throw ProviderError(ProviderErrorKind::InvalidInterval, "interval '" + req.interval + "' rejected by exchange");
    std::string snippet = res.body.substr(0, 200);
    throw ProviderError(ProviderErrorKind::UnexpectedProviderFailure,
                        "GET https://" + res.final_host + res.final_target + " returned HTTP " +
                        std::to_string(res.status) + (snippet.empty() ? "" : ": " + snippet));
  }

  model::PriceSeries series = parse_klines(res.body);
  if (series.empty())
    throw ProviderError(ProviderErrorKind::EmptySeries,
                        "no data returned for " + symbol + " with interval " + req.interval);
  return series;
}

} // namespace tickplot::provider
