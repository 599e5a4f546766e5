#pragma once

#include <cstdint>
#include <string_view>

#include "currency-metadata.hpp"
#include "currencycode.hpp"

namespace fxc {

/// Currency meta data from a static ISO 4217 table of active currencies.
/// Fraction digits are the default ones used for display. Unknown currencies use kDefaultFractionDigits.
class IsoCurrencyMetadata : public CurrencyMetadata {
 public:
  struct CurrencyInfo {
    CurrencyCode currencyCode;
    int8_t fractionDigits;
    std::string_view name;
  };

  [[nodiscard]] int8_t fractionDigits(CurrencyCode currencyCode) const override;

  [[nodiscard]] bool isKnown(CurrencyCode currencyCode) const { return find(currencyCode) != nullptr; }

  /// Get the english name of given currency, or an empty string if it is unknown.
  [[nodiscard]] std::string_view name(CurrencyCode currencyCode) const;

 private:
  static const CurrencyInfo *find(CurrencyCode currencyCode);
};

}  // namespace fxc
