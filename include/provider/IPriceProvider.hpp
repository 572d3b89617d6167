#pragma once
#include "model/PriceSeries.hpp"
#include <stdexcept>
#include <string>

namespace tickplot::provider {

enum class ProviderErrorKind {
  InvalidInterval,           // interval token outside the accepted set
  InvalidSymbol,             // exchange rejected the symbol
  EmptySeries,               // request was valid but returned no points
  UnexpectedProviderFailure  // network, TLS, HTTP or payload errors
};

[[nodiscard]] const char* to_string(ProviderErrorKind k);

class ProviderError : public std::runtime_error {
public:
  ProviderError(ProviderErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
  [[nodiscard]] ProviderErrorKind kind() const { return kind_; }
  // Validation failures are the caller's input; everything else is not.
  [[nodiscard]] bool is_validation() const { return kind_ != ProviderErrorKind::UnexpectedProviderFailure; }
private:
  ProviderErrorKind kind_;
};

struct KlineRequest {
  std::string base_currency;
  std::string quote_currency;
  std::string interval;  // token, validated by the provider
  int periods{0};
};

// Source of OHLC series. fetch() either returns a non-empty series or
// throws ProviderError.
class IPriceProvider {
public:
  virtual ~IPriceProvider() = default;

  [[nodiscard]] virtual model::PriceSeries fetch(const KlineRequest& req) = 0;
};

} // namespace tickplot::provider
