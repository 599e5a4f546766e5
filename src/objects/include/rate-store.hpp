#pragma once

#include <optional>

#include "currencycode.hpp"
#include "monetaryamount.hpp"

namespace fxc {

/// Source of exchange rates, all expressed relatively to a single base currency.
class RateStore {
 public:
  virtual ~RateStore() = default;

  /// Get the number of units of 'currencyCode' for 1 unit of the base currency, valid now.
  /// Returns std::nullopt if there is no such rate.
  [[nodiscard]] virtual std::optional<MonetaryAmount> currentRatePerBase(CurrencyCode currencyCode) const = 0;
};

}  // namespace fxc
