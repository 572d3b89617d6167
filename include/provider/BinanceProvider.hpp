#pragma once
#include "provider/IPriceProvider.hpp"
#include <optional>
#include <string>
#include <utility>

namespace tickplot::provider {

// Public Binance spot klines over HTTPS (no API key).
class BinanceProvider : public IPriceProvider {
public:
  explicit BinanceProvider(std::string host = "api.binance.com", int timeout_sec = 20)
      : host_(std::move(host)), timeout_sec_(timeout_sec) {}

  [[nodiscard]] model::PriceSeries fetch(const KlineRequest& req) override;

  static constexpr int kMaxLimit = 1000;

  [[nodiscard]] static std::string klines_target(const std::string& symbol,
                                                 const std::string& interval, int limit);

private:
  std::string host_;
  int timeout_sec_;
};

// Payload helpers, exposed for tests.
// Throws ProviderError(UnexpectedProviderFailure) on malformed payloads.
[[nodiscard]] model::PriceSeries parse_klines(const std::string& body);
// Binance error body {"code":-1121,"msg":"..."} -> code
[[nodiscard]] std::optional<long long> binance_error_code(const std::string& body);

} // namespace tickplot::provider
