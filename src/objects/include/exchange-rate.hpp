#pragma once

#include "currencycode.hpp"
#include "fxc_string.hpp"
#include "monetaryamount.hpp"
#include "timedef.hpp"

namespace fxc {

/// Number of units of a currency for 1 unit of the base currency, valid within a time window.
/// Both bounds of the validity window are inclusive.
struct ExchangeRate {
  [[nodiscard]] constexpr bool isValidAt(TimePoint timePoint) const noexcept {
    return validFrom <= timePoint && timePoint <= validTo;
  }

  /// Returns true if the validity window of this rate intersects [from, to].
  [[nodiscard]] constexpr bool overlaps(TimePoint from, TimePoint to) const noexcept {
    return validFrom <= to && validTo >= from;
  }

  /// Returns true if the validity window of this rate is fully inside [from, to].
  [[nodiscard]] constexpr bool isInside(TimePoint from, TimePoint to) const noexcept {
    return from <= validFrom && validTo <= to;
  }

  CurrencyCode currency;
  string currencyName;
  MonetaryAmount unitsPerBase;
  TimePoint validFrom = TimePoint::min();
  TimePoint validTo = TimePoint::max();
};

}  // namespace fxc
