#pragma once

#include <cstdint>

#include "currencycode.hpp"

namespace fxc {

/// Provides display properties of currencies.
class CurrencyMetadata {
 public:
  /// Number of fraction digits used for currencies without specific meta data.
  static constexpr int8_t kDefaultFractionDigits = 2;

  virtual ~CurrencyMetadata() = default;

  /// Get the number of fractional digits used to display amounts of given currency (2 for USD, 0 for JPY).
  [[nodiscard]] virtual int8_t fractionDigits(CurrencyCode currencyCode) const = 0;
};

}  // namespace fxc
