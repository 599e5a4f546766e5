#pragma once

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>

#include "currencycode.hpp"
#include "fxc_exception.hpp"
#include "fxc_format.hpp"
#include "fxc_string.hpp"
#include "ipow.hpp"
#include "ndigits.hpp"

namespace fxc {

/// Represents a fixed-precision decimal amount with an optional CurrencyCode.
/// It is designed to be
///  - exact: amount is stored in a int64_t with a number of decimals, there is no binary floating point involved in
///    parsing, arithmetic and rounding
///  - small (16 bytes only). Thus can be passed by copy instead of reference (it is trivially copyable)
///
/// A MonetaryAmount without currency is called 'neutral'. Exchange rates are neutral amounts.
///
/// The integral value stored in the MonetaryAmount is multiplied by 10^'_nbDecimals'.
/// Its number of decimals is automatically simplified (trailing zeros are removed), so that each value has a unique
/// representation.
/// It supports up to 18 significant digits, with at most 17 decimals.
///
/// Examples: 50 USD, -2.045 EUR, 0.9200000 (neutral)
class MonetaryAmount {
 public:
  using AmountType = int64_t;

  /// kDown rounds towards negative infinity, kUp towards positive infinity,
  /// kNearest to the nearest value, ties away from zero.
  enum class RoundType : int8_t { kDown, kUp, kNearest };

  static constexpr int8_t kMaxNbDecimals = std::numeric_limits<AmountType>::digits10 - 1;

  /// Constructs a MonetaryAmount with a value of 0 of neutral currency.
  constexpr MonetaryAmount() noexcept = default;

  /// Constructs a MonetaryAmount representing the integer 'amount' with given currency (neutral by default)
  constexpr explicit MonetaryAmount(std::integral auto amount, CurrencyCode currencyCode = CurrencyCode())
      : _amount(static_cast<AmountType>(amount)), _currencyCode(currencyCode) {
    sanitize();
  }

  /// Constructs a new MonetaryAmount from an integral representation which is already multiplied by given
  /// number of decimals.
  /// Example: MonetaryAmount(423, "EUR", 2) is 4.23 EUR
  constexpr MonetaryAmount(AmountType amount, CurrencyCode currencyCode, int8_t nbDecimals)
      : _amount(amount), _currencyCode(currencyCode), _nbDecimals(nbDecimals) {
    sanitize();
  }

  /// Constructs a new MonetaryAmount from a string containing an amount and an optional currency.
  /// A space can be present or not between the amount and the currency code.
  /// If given string is empty, it is equivalent to a default constructor.
  /// invalid_argument is raised if the string is not a valid amount.
  /// Examples: "10.5EUR"   -> 10.5 units of currency EUR
  ///           "45 JPY"    -> 45 units of currency JPY
  ///           "-345.8909" -> -345.8909 units of no currency
  explicit MonetaryAmount(std::string_view amountCurrencyStr);

  /// Constructs a new MonetaryAmount from a string representing the amount only and a currency code.
  /// If 'amountStr' is empty, the amount will be set to 0.
  MonetaryAmount(std::string_view amountStr, CurrencyCode currencyCode);

  /// Constructs a new MonetaryAmount from another MonetaryAmount and a new CurrencyCode.
  /// Use this constructor to change currency of an existing MonetaryAmount.
  constexpr MonetaryAmount(MonetaryAmount monetaryAmount, CurrencyCode newCurrencyCode) noexcept
      : _amount(monetaryAmount._amount), _currencyCode(newCurrencyCode), _nbDecimals(monetaryAmount._nbDecimals) {}

  /// Get an integral representation of this MonetaryAmount multiplied by current number of decimals.
  /// Example: "5.6235" will return 56235
  [[nodiscard]] constexpr AmountType amount() const noexcept { return _amount; }

  /// Get an integral representation of this MonetaryAmount multiplied by given number of decimals.
  /// Extra decimals are truncated. If an overflow would occur for the resulting amount, return std::nullopt
  /// Example: "5.6235" with 6 decimals will return 5623500
  [[nodiscard]] std::optional<AmountType> amount(int8_t nbDecimals) const;

  /// Get the integer part of the amount of this MonetaryAmount.
  [[nodiscard]] constexpr AmountType integerPart() const noexcept {
    return _amount / ipow10(static_cast<uint8_t>(_nbDecimals));
  }

  /// Get the decimal part of the amount of this MonetaryAmount.
  /// Warning: starting zeros will not be part of the returned value. Use nbDecimals to retrieve the number of decimals
  /// of this MonetaryAmount.
  /// Example: "45.046" decimalPart() = 46
  [[nodiscard]] constexpr AmountType decimalPart() const noexcept {
    return _amount - (integerPart() * ipow10(static_cast<uint8_t>(_nbDecimals)));
  }

  /// Get the amount of this MonetaryAmount in double format, for display purposes only.
  [[nodiscard]] constexpr double toDouble() const {
    return static_cast<double>(_amount) / static_cast<double>(ipow10(static_cast<uint8_t>(_nbDecimals)));
  }

  [[nodiscard]] constexpr CurrencyCode currencyCode() const noexcept { return _currencyCode; }

  [[nodiscard]] constexpr int8_t nbDecimals() const noexcept { return _nbDecimals; }

  /// Rounds current monetary amount according to given precision (number of decimals).
  /// Does nothing if current number of decimals is already lower or equal to 'nbDecimals'.
  void round(int8_t nbDecimals, RoundType roundType);

  /// Truncate the MonetaryAmount such that it will contain at most maxNbDecimals.
  /// Does nothing if maxNbDecimals is larger than current number of decimals
  constexpr void truncate(int8_t maxNbDecimals) noexcept {
    if (maxNbDecimals < _nbDecimals) {
      _amount /= ipow10(static_cast<uint8_t>(_nbDecimals - maxNbDecimals));
      _nbDecimals = maxNbDecimals;
      simplifyDecimals();
    }
  }

  /// Comparison of two MonetaryAmounts of the same currency.
  /// exception is raised if currencies are different.
  [[nodiscard]] std::strong_ordering operator<=>(const MonetaryAmount &other) const;

  [[nodiscard]] constexpr bool operator==(const MonetaryAmount &) const noexcept = default;

  /// Note: for comparison with integrals, only the amount is compared, currency is ignored.
  [[nodiscard]] constexpr bool operator==(std::signed_integral auto amount) const noexcept {
    return _amount == static_cast<AmountType>(amount) && _nbDecimals == 0;
  }

  [[nodiscard]] constexpr std::strong_ordering operator<=>(std::signed_integral auto amount) const noexcept {
    if (_amount < 0 && amount >= 0) {
      return std::strong_ordering::less;
    }
    if (_amount >= 0 && amount < 0) {
      return std::strong_ordering::greater;
    }
    const auto intPart = integerPart();
    if (intPart != static_cast<AmountType>(amount)) {
      return intPart <=> static_cast<AmountType>(amount);
    }
    return decimalPart() <=> 0;
  }

  [[nodiscard]] constexpr MonetaryAmount abs() const noexcept {
    return {true, _amount < 0 ? -_amount : _amount, _currencyCode, _nbDecimals};
  }

  [[nodiscard]] constexpr MonetaryAmount operator-() const noexcept {
    return {true, -_amount, _currencyCode, _nbDecimals};
  }

  /// Addition of two MonetaryAmounts.
  /// They should have same currency for addition to be possible.
  /// Exception: default MonetaryAmount (0 with neutral currency) is a neutral element for addition and subtraction.
  [[nodiscard]] MonetaryAmount operator+(MonetaryAmount other) const;

  [[nodiscard]] MonetaryAmount operator-(MonetaryAmount other) const { return *this + (-other); }

  MonetaryAmount &operator+=(MonetaryAmount other) { return *this = *this + other; }
  MonetaryAmount &operator-=(MonetaryAmount other) { return *this = *this + (-other); }

  /// Multiplication involving 2 MonetaryAmounts *must* have at least one 'Neutral' currency.
  /// This is to remove ambiguity on the resulting currency:
  ///  - Neutral * Neutral -> Neutral
  ///  - XXX * Neutral     -> XXX
  ///  - Neutral * YYY     -> YYY
  ///  - XXX * YYY         -> exception will be thrown in this case
  /// The product is computed exactly, then its least significant decimals are truncated if it does not fit on 18
  /// digits.
  [[nodiscard]] MonetaryAmount operator*(MonetaryAmount mult) const;

  [[nodiscard]] MonetaryAmount operator*(std::signed_integral auto mult) const { return *this * MonetaryAmount(mult); }

  MonetaryAmount &operator*=(MonetaryAmount mult) { return *this = *this * mult; }

  /// Multiplies by 'mult' and rounds the exact product to 'nbDecimals' decimals.
  /// Unlike operator*, least significant digits are never truncated before rounding.
  /// Returns std::nullopt if the rounded product does not fit in 18 significant digits.
  [[nodiscard]] std::optional<MonetaryAmount> multiplyAndRound(MonetaryAmount mult, int8_t nbDecimals,
                                                               RoundType roundType) const;

  /// Division of two MonetaryAmounts.
  ///  - XXX / XXX         -> Neutral
  ///  - XXX / Neutral     -> XXX
  ///  - Neutral / YYY     -> YYY
  ///  - XXX / YYY         -> exception will be thrown in this case
  /// The quotient is computed with up to 18 significant digits, and at most 17 decimals, truncated.
  /// exception is raised on a division by zero.
  [[nodiscard]] MonetaryAmount operator/(MonetaryAmount div) const;

  [[nodiscard]] MonetaryAmount operator/(std::signed_integral auto div) const { return *this / MonetaryAmount(div); }

  MonetaryAmount &operator/=(MonetaryAmount div) { return *this = *this / div; }

  [[nodiscard]] constexpr MonetaryAmount toNeutral() const noexcept { return {true, _amount, {}, _nbDecimals}; }

  [[nodiscard]] constexpr bool isDefault() const noexcept { return _amount == 0 && hasNeutralCurrency(); }

  [[nodiscard]] constexpr bool hasNeutralCurrency() const noexcept { return _currencyCode.isNeutral(); }

  [[nodiscard]] constexpr bool isAmountInteger() const noexcept { return _nbDecimals == 0; }

  /// Appends a string representation of the amount to given output iterator.
  /// At least 'minNbDecimals' decimals are written, padded with zeros if needed.
  /// Example: 92 with minNbDecimals 2 is written '92.00'
  template <class OutputIt>
  OutputIt appendAmount(OutputIt it, int8_t minNbDecimals = 0) const {
    if (_amount < 0) {
      *it = '-';
      ++it;
    }
    const AmountType absIntPart = integerPart() < 0 ? -integerPart() : integerPart();
    const AmountType absDecPart = decimalPart() < 0 ? -decimalPart() : decimalPart();

    it = fxc::format_to(it, "{}", absIntPart);

    const int8_t nbDecimalsToWrite = std::max(_nbDecimals, minNbDecimals);
    if (nbDecimalsToWrite > 0) {
      *it = '.';
      ++it;
      if (_nbDecimals > 0) {
        it = fxc::format_to(it, "{:0{}}", absDecPart, static_cast<int>(_nbDecimals));
      }
      it = std::fill_n(it, nbDecimalsToWrite - _nbDecimals, '0');
    }
    return it;
  }

  /// Appends a string representation of the amount plus its currency to given output iterator
  template <class OutputIt>
  OutputIt append(OutputIt it, int8_t minNbDecimals = 0) const {
    it = appendAmount(it, minNbDecimals);
    if (!hasNeutralCurrency()) {
      *it = ' ';
      it = _currencyCode.appendTo(++it);
    }
    return it;
  }

  /// Get a string representation of the amount hold by this MonetaryAmount (without currency).
  [[nodiscard]] string amountStr(int8_t minNbDecimals = 0) const {
    string ret;
    appendAmount(std::back_inserter(ret), minNbDecimals);
    return ret;
  }

  /// Get a string of this MonetaryAmount, with its currency if not neutral.
  [[nodiscard]] string str(int8_t minNbDecimals = 0) const {
    string ret;
    append(std::back_inserter(ret), minNbDecimals);
    return ret;
  }

  friend std::ostream &operator<<(std::ostream &os, const MonetaryAmount &ma);

 private:
  static constexpr AmountType kMaxAmountFullNDigits = ipow10(std::numeric_limits<AmountType>::digits10);

  /// Private constructor to set fields directly without checks.
  /// We add a dummy bool parameter to differentiate it from the public constructor.
  constexpr MonetaryAmount(bool, AmountType amount, CurrencyCode currencyCode, int8_t nbDecimals) noexcept
      : _amount(amount), _currencyCode(currencyCode), _nbDecimals(nbDecimals) {}

  constexpr void simplifyDecimals() noexcept {
    if (_amount == 0) {
      _nbDecimals = 0;
    } else {
      for (; _nbDecimals > 0 && _amount % 10 == 0; --_nbDecimals) {
        _amount /= 10;
      }
    }
  }

  constexpr void sanitize() {
    if (_nbDecimals < 0) {
      throw exception("Negative number of decimals {} is not supported", _nbDecimals);
    }
    truncate(kMaxNbDecimals);
    while (_amount >= kMaxAmountFullNDigits || _amount <= -kMaxAmountFullNDigits) {
      if (_nbDecimals == 0) {
        throw exception("Integral part of amount {} is too big", _amount);
      }
      _amount /= 10;
      --_nbDecimals;
    }
    simplifyDecimals();
  }

  AmountType _amount{};
  CurrencyCode _currencyCode;
  int8_t _nbDecimals{};
};

static_assert(sizeof(MonetaryAmount) <= 16, "MonetaryAmount size should stay small");
static_assert(std::is_trivially_copyable_v<MonetaryAmount>, "MonetaryAmount should be trivially copyable");

}  // namespace fxc

template <>
struct fmt::formatter<fxc::MonetaryAmount> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxc::MonetaryAmount &ma, FormatContext &ctx) const -> decltype(ctx.out()) {
    return ma.append(ctx.out());
  }
};
