#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "currencycode.hpp"
#include "fxc_exception.hpp"
#include "fxc_format.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "monetaryamount.hpp"

namespace fxc {

class CurrencyMetadata;
class RateStore;

enum class CurrencyRole : int8_t { source, destination };

constexpr std::string_view CurrencyRoleName(CurrencyRole currencyRole) {
  return currencyRole == CurrencyRole::source ? "source" : "destination";
}

/// Raised when there is no current exchange rate for a currency.
class currency_not_found : public exception {
 public:
  currency_not_found(CurrencyCode currencyCode, CurrencyRole currencyRole)
      : exception("No current rate found for {} currency {}", CurrencyRoleName(currencyRole), currencyCode),
        _currencyCode(currencyCode),
        _currencyRole(currencyRole) {}

  CurrencyCode currencyCode() const noexcept { return _currencyCode; }

  CurrencyRole role() const noexcept { return _currencyRole; }

 private:
  CurrencyCode _currencyCode;
  CurrencyRole _currencyRole;
};

/// Raised when the amount to convert is negative, in another currency than the source one, or too large.
class invalid_amount : public invalid_argument {
 public:
  explicit invalid_amount(MonetaryAmount amount) : invalid_argument("Amount must be positive, got {}", amount) {}

  template <typename... Args>
  explicit invalid_amount(format_string<Args...> fmt, Args &&...args)
      : invalid_argument(fmt, std::forward<Args>(args)...) {}
};

struct ConversionResult {
  MonetaryAmount destinationAmount;
  MonetaryAmount exchangeRate;
};

/// Computes exchange rates between two currencies from rates expressed relatively to a single base currency, and
/// converts amounts with them.
///
/// It has no mutable state and can be used concurrently, as long as its collaborators can.
class RateCalculator {
 public:
  /// All rates of the rate store are expressed in units of currency per 1 unit of this currency.
  static constexpr CurrencyCode kBaseCurrency = "GBP";

  /// Number of decimals of the exchange rate used for conversions.
  static constexpr int8_t kRatePrecision = 7;

  RateCalculator(const RateStore &rateStore, const CurrencyMetadata &currencyMetadata)
      : _rateStore(rateStore), _currencyMetadata(currencyMetadata) {}

  /// Get the exchange rate to convert 1 unit of 'sourceCurrency' into 'destinationCurrency', at full precision.
  /// The base currency is never looked up in the rate store, its rate is exactly 1.
  /// currency_not_found is raised if there is no current rate for one of the currencies, source being checked first.
  [[nodiscard]] MonetaryAmount getRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency) const;

  /// Get the exchange rate rounded to kRatePrecision decimals, as used by convert.
  [[nodiscard]] MonetaryAmount roundedRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency) const;

  /// Converts 'amount' of 'sourceCurrency' into 'destinationCurrency'.
  /// The destination amount is rounded to the fraction digits of the destination currency, ties away from zero.
  /// 'amount' should be neutral or expressed in 'sourceCurrency'.
  /// invalid_amount is raised if 'amount' is negative, in another currency or if the converted amount does not fit in
  /// a MonetaryAmount. currency_not_found is raised if a rate is missing.
  [[nodiscard]] ConversionResult convert(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency,
                                         MonetaryAmount amount) const;

 private:
  MonetaryAmount ratePerBase(CurrencyCode currencyCode, CurrencyRole currencyRole) const;

  const RateStore &_rateStore;
  const CurrencyMetadata &_currencyMetadata;
};

}  // namespace fxc
