#include "monetaryamount.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <ostream>
#include <string_view>
#include <tuple>
#include <utility>

#include "currencycode.hpp"
#include "fxc_config.hpp"
#include "fxc_exception.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "ipow.hpp"
#include "ndigits.hpp"

namespace fxc {

namespace {

using UnsignedAmountType = uint64_t;

constexpr std::string_view kSpaces = " \t";

constexpr bool IsAmountChar(char ch) { return (ch >= '0' && ch <= '9') || ch == '.' || ch == '-' || ch == '+'; }

std::string_view Trim(std::string_view str) {
  const auto first = str.find_first_not_of(kSpaces);
  if (first == std::string_view::npos) {
    return {};
  }
  return str.substr(first, str.find_last_not_of(kSpaces) + 1U - first);
}

/// Parses a decimal number string into its integral representation and its number of decimals.
/// Decimals that do not fit are truncated.
std::pair<MonetaryAmount::AmountType, int8_t> AmountIntegralFromStr(std::string_view amountStr) {
  using AmountType = MonetaryAmount::AmountType;

  amountStr = Trim(amountStr);
  if (amountStr.empty()) {
    return {};
  }

  bool isNeg = false;
  if (amountStr.front() == '-' || amountStr.front() == '+') {
    isNeg = amountStr.front() == '-';
    amountStr.remove_prefix(1);
  }

  AmountType integralValue = 0;
  int8_t nbDecimals = 0;
  bool dotSeen = false;
  bool digitSeen = false;
  bool truncating = false;

  for (char ch : amountStr) {
    if (ch == '.') {
      if (dotSeen) {
        throw invalid_argument("Invalid amount '{}', more than one decimal separator", amountStr);
      }
      dotSeen = true;
      continue;
    }
    if (ch < '0' || ch > '9') {
      throw invalid_argument("Invalid character '{}' in amount '{}'", ch, amountStr);
    }
    digitSeen = true;
    if (truncating) {
      continue;
    }
    const int digit = ch - '0';
    if (integralValue > (std::numeric_limits<AmountType>::max() - digit) / 10 ||
        (dotSeen && nbDecimals == MonetaryAmount::kMaxNbDecimals)) {
      if (!dotSeen) {
        throw invalid_argument("Amount '{}' is too big", amountStr);
      }
      truncating = true;
      continue;
    }
    integralValue = 10 * integralValue + digit;
    if (dotSeen) {
      ++nbDecimals;
    }
  }

  if (!digitSeen) {
    throw invalid_argument("Invalid amount '{}', no digit found", amountStr);
  }

  return {isNeg ? -integralValue : integralValue, nbDecimals};
}

/// Aligns both amounts to the same number of decimals.
/// Decimals of the most precise one are truncated if the other one cannot be expanded without overflow.
int8_t SafeConvertSameDecimals(MonetaryAmount::AmountType &lhsAmount, MonetaryAmount::AmountType &rhsAmount,
                               int8_t lhsNbDecimals, int8_t rhsNbDecimals) {
  constexpr MonetaryAmount::AmountType kMaxMultipliable = ipow10(std::numeric_limits<int64_t>::digits10 - 1);
  while (lhsNbDecimals < rhsNbDecimals) {
    if (lhsAmount < kMaxMultipliable && lhsAmount > -kMaxMultipliable) {
      lhsAmount *= 10;
      ++lhsNbDecimals;
    } else {
      rhsAmount /= 10;
      --rhsNbDecimals;
    }
  }
  while (rhsNbDecimals < lhsNbDecimals) {
    if (rhsAmount < kMaxMultipliable && rhsAmount > -kMaxMultipliable) {
      rhsAmount *= 10;
      ++rhsNbDecimals;
    } else {
      lhsAmount /= 10;
      --lhsNbDecimals;
    }
  }
  return lhsNbDecimals;
}

/// Exact product of two numbers below 10^18 in absolute value, on 4 limbs of 9 digits (most significant first).
std::array<UnsignedAmountType, 4> ExactProductLimbs(MonetaryAmount::AmountType lhsAmount,
                                                    MonetaryAmount::AmountType rhsAmount) {
  static constexpr UnsignedAmountType kLimbBase = 1000000000ULL;

  const auto lhs = static_cast<UnsignedAmountType>(std::abs(lhsAmount));
  const auto rhs = static_cast<UnsignedAmountType>(std::abs(rhsAmount));
  const UnsignedAmountType lhsHigh = lhs / kLimbBase;
  const UnsignedAmountType lhsLow = lhs % kLimbBase;
  const UnsignedAmountType rhsHigh = rhs / kLimbBase;
  const UnsignedAmountType rhsLow = rhs % kLimbBase;

  std::array<UnsignedAmountType, 4> limbs{};

  UnsignedAmountType partial = lhsLow * rhsLow;
  limbs[3] = partial % kLimbBase;
  UnsignedAmountType carry = partial / kLimbBase;

  partial = (lhsHigh * rhsLow) % kLimbBase + (lhsLow * rhsHigh) % kLimbBase + carry;
  limbs[2] = partial % kLimbBase;
  carry = partial / kLimbBase + (lhsHigh * rhsLow) / kLimbBase + (lhsLow * rhsHigh) / kLimbBase;

  partial = lhsHigh * rhsHigh + carry;
  limbs[1] = partial % kLimbBase;
  limbs[0] = partial / kLimbBase;

  return limbs;
}

}  // namespace

MonetaryAmount::MonetaryAmount(std::string_view amountCurrencyStr) {
  amountCurrencyStr = Trim(amountCurrencyStr);
  const auto endAmountPos =
      std::find_if_not(amountCurrencyStr.begin(), amountCurrencyStr.end(), IsAmountChar) - amountCurrencyStr.begin();
  const std::string_view amountStr = amountCurrencyStr.substr(0, endAmountPos);
  const std::string_view currencyStr = Trim(amountCurrencyStr.substr(endAmountPos));
  if (amountStr.empty() && !currencyStr.empty()) {
    throw invalid_argument("Cannot construct MonetaryAmount '{}' with a currency without any amount",
                           amountCurrencyStr);
  }

  std::tie(_amount, _nbDecimals) = AmountIntegralFromStr(amountStr);
  _currencyCode = CurrencyCode(currencyStr);
  sanitize();
}

MonetaryAmount::MonetaryAmount(std::string_view amountStr, CurrencyCode currencyCode) : _currencyCode(currencyCode) {
  std::tie(_amount, _nbDecimals) = AmountIntegralFromStr(amountStr);
  sanitize();
}

std::optional<MonetaryAmount::AmountType> MonetaryAmount::amount(int8_t nbDecimals) const {
  AmountType integralAmount = _amount;
  for (int8_t nbD = _nbDecimals; nbD < nbDecimals; ++nbD) {
    if (integralAmount > std::numeric_limits<AmountType>::max() / 10 ||
        integralAmount < std::numeric_limits<AmountType>::min() / 10) {
      return std::nullopt;
    }
    integralAmount *= 10;
  }
  if (nbDecimals < _nbDecimals) {
    integralAmount /= ipow10(static_cast<uint8_t>(_nbDecimals - nbDecimals));
  }
  return integralAmount;
}

void MonetaryAmount::round(int8_t nbDecimals, RoundType roundType) {
  if (nbDecimals < 0) {
    throw exception("Cannot round to a negative number of decimals {}", nbDecimals);
  }
  if (nbDecimals >= _nbDecimals) {
    return;
  }
  const AmountType epsilon = ipow10(static_cast<uint8_t>(_nbDecimals - nbDecimals));
  const AmountType rem = _amount % epsilon;

  // truncate towards zero first, then possibly move one epsilon away from zero
  _amount -= rem;

  bool awayFromZero = false;
  switch (roundType) {
    case RoundType::kDown:
      awayFromZero = rem < 0;
      break;
    case RoundType::kUp:
      awayFromZero = rem > 0;
      break;
    case RoundType::kNearest:
      awayFromZero = 2 * std::abs(rem) >= epsilon;
      break;
    default:
      throw exception("Unknown round type {}", static_cast<int>(roundType));
  }
  if (awayFromZero) {
    _amount += rem < 0 ? -epsilon : epsilon;
  }

  _amount /= epsilon;
  _nbDecimals = nbDecimals;
  sanitize();
}

std::strong_ordering MonetaryAmount::operator<=>(const MonetaryAmount &other) const {
  if (_currencyCode != other._currencyCode) {
    throw exception("Cannot compare amounts with different currency '{}' and '{}'", _currencyCode,
                    other._currencyCode);
  }
  if (_nbDecimals == other._nbDecimals) {
    return _amount <=> other._amount;
  }
  const auto lhsIntAmount = integerPart();
  const auto rhsIntAmount = other.integerPart();
  if (lhsIntAmount != rhsIntAmount) {
    return lhsIntAmount <=> rhsIntAmount;
  }
  // Same integral part, so expanding one's number of decimals towards the other one cannot overflow
  AmountType lhsAmount = _amount;
  AmountType rhsAmount = other._amount;
  SafeConvertSameDecimals(lhsAmount, rhsAmount, _nbDecimals, other._nbDecimals);
  return lhsAmount <=> rhsAmount;
}

MonetaryAmount MonetaryAmount::operator+(MonetaryAmount other) const {
  if (isDefault()) {
    return other;
  }
  if (other.isDefault()) {
    return *this;
  }
  if (_currencyCode != other._currencyCode) {
    throw exception("Addition is only possible on amounts with same currency, not '{}' and '{}'", _currencyCode,
                    other._currencyCode);
  }
  AmountType lhsAmount = _amount;
  AmountType rhsAmount = other._amount;
  const int8_t resNbDecimals = SafeConvertSameDecimals(lhsAmount, rhsAmount, _nbDecimals, other._nbDecimals);
  // both operands are below 10^18 in absolute value, so their sum fits
  return {lhsAmount + rhsAmount, _currencyCode, resNbDecimals};
}

MonetaryAmount MonetaryAmount::operator*(MonetaryAmount mult) const {
  if (!hasNeutralCurrency() && !mult.hasNeutralCurrency()) {
    throw exception("Cannot multiply two non neutral MonetaryAmounts '{}' * '{}'", *this, mult);
  }
  const CurrencyCode resCurrency = hasNeutralCurrency() ? mult._currencyCode : _currencyCode;

  const bool isNeg = (_amount < 0) != (mult._amount < 0);

  const std::array<UnsignedAmountType, 4> limbs = ExactProductLimbs(_amount, mult._amount);

  // Count significant digits of the product
  auto firstNonZero = std::find_if(limbs.begin(), limbs.end(), [](UnsignedAmountType limb) { return limb != 0; });
  if (firstNonZero == limbs.end()) {
    return MonetaryAmount(0, resCurrency);
  }
  const auto firstLimbPos = static_cast<int>(firstNonZero - limbs.begin());
  const int nbSignificantDigits = ndigits(*firstNonZero) + 9 * (3 - firstLimbPos);

  int nbDecs = static_cast<int>(_nbDecimals) + static_cast<int>(mult._nbDecimals);
  const int nbDigitsTruncate = nbSignificantDigits - std::numeric_limits<AmountType>::digits10;

  // Rebuild the product, dropping the 'nbDigitsTruncate' least significant digits if needed
  UnsignedAmountType result = 0;
  const int nbDigitsToDrop = std::max(nbDigitsTruncate, 0);
  if (nbDigitsToDrop > nbDecs) {
    throw exception("Overflow during multiplication {} * {}", *this, mult);
  }
  nbDecs -= nbDigitsToDrop;
  for (int limbPos = firstLimbPos; limbPos < 4; ++limbPos) {
    const int nbDigitsInLimbToDrop = std::max(0, nbDigitsToDrop - 9 * (3 - limbPos));
    if (nbDigitsInLimbToDrop >= 9) {
      break;
    }
    const auto keptMult = static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(9 - nbDigitsInLimbToDrop)));
    result = result * keptMult + limbs[limbPos] /
             static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDigitsInLimbToDrop)));
  }

  const auto signedResult = static_cast<AmountType>(result);
  return {isNeg ? -signedResult : signedResult, resCurrency, static_cast<int8_t>(nbDecs)};
}

std::optional<MonetaryAmount> MonetaryAmount::multiplyAndRound(MonetaryAmount mult, int8_t nbDecimals,
                                                               RoundType roundType) const {
  if (!hasNeutralCurrency() && !mult.hasNeutralCurrency()) {
    throw exception("Cannot multiply two non neutral MonetaryAmounts '{}' * '{}'", *this, mult);
  }
  if (nbDecimals < 0) {
    throw exception("Cannot round to a negative number of decimals {}", nbDecimals);
  }
  const CurrencyCode resCurrency = hasNeutralCurrency() ? mult._currencyCode : _currencyCode;
  const bool isNeg = (_amount < 0) != (mult._amount < 0);

  // Decimal digits of the exact product, most significant first. The last 'productNbDecs' ones are decimals.
  static constexpr int kNbProductDigits = 36;
  std::array<int8_t, kNbProductDigits> digits{};
  const std::array<UnsignedAmountType, 4> limbs = ExactProductLimbs(_amount, mult._amount);
  for (int limbPos = 0; limbPos < 4; ++limbPos) {
    UnsignedAmountType limb = limbs[limbPos];
    for (int digitPos = (9 * limbPos) + 8; digitPos >= 9 * limbPos; --digitPos) {
      digits[digitPos] = static_cast<int8_t>(limb % 10);
      limb /= 10;
    }
  }

  const int productNbDecs = static_cast<int>(_nbDecimals) + static_cast<int>(mult._nbDecimals);
  int resNbDecs = std::min(productNbDecs, static_cast<int>(nbDecimals));
  int endPos = kNbProductDigits - (productNbDecs - resNbDecs);

  // Rounding decision is taken on the dropped digits, before any narrowing of the result
  bool awayFromZero = false;
  if (endPos < kNbProductDigits) {
    const bool hasDroppedDigits = std::any_of(digits.begin() + endPos, digits.end(), [](int8_t d) { return d != 0; });
    switch (roundType) {
      case RoundType::kDown:
        awayFromZero = hasDroppedDigits && isNeg;
        break;
      case RoundType::kUp:
        awayFromZero = hasDroppedDigits && !isNeg;
        break;
      case RoundType::kNearest:
        awayFromZero = digits[endPos] >= 5;
        break;
      default:
        throw exception("Unknown round type {}", static_cast<int>(roundType));
    }
  }
  if (awayFromZero) {
    int digitPos = endPos - 1;
    for (; digitPos >= 0 && digits[digitPos] == 9; --digitPos) {
      digits[digitPos] = 0;
    }
    if (digitPos < 0) {
      return std::nullopt;
    }
    ++digits[digitPos];
  }

  for (; resNbDecs > 0 && digits[endPos - 1] == 0; --resNbDecs) {
    --endPos;
  }
  const auto firstSignificant =
      std::find_if(digits.begin(), digits.begin() + endPos, [](int8_t d) { return d != 0; }) - digits.begin();
  if (endPos - firstSignificant > std::numeric_limits<AmountType>::digits10) {
    return std::nullopt;
  }

  AmountType result = 0;
  for (auto digitPos = firstSignificant; digitPos < endPos; ++digitPos) {
    result = (10 * result) + digits[digitPos];
  }
  return MonetaryAmount(isNeg ? -result : result, resCurrency, static_cast<int8_t>(resNbDecs));
}

MonetaryAmount MonetaryAmount::operator/(MonetaryAmount div) const {
  CurrencyCode resCurrency;
  if (!hasNeutralCurrency() && !div.hasNeutralCurrency()) {
    if (FXC_UNLIKELY(_currencyCode != div._currencyCode)) {
      throw exception("Cannot divide two non neutral MonetaryAmounts of different currency: '{}' / '{}'", *this, div);
    }
    // Divide same currency have a neutral result
  } else {
    resCurrency = hasNeutralCurrency() ? div._currencyCode : _currencyCode;
  }
  if (FXC_UNLIKELY(div._amount == 0)) {
    throw exception("Division of {} by zero", *this);
  }

  const bool isNeg = (_amount < 0) != (div._amount < 0);

  // Switch to an unsigned temporarily to ensure that lhs > rhs before the divide.
  // Indeed, on 64 bits the unsigned integral type can hold one more digit than its signed counterpart.
  static_assert(std::numeric_limits<UnsignedAmountType>::digits10 > std::numeric_limits<AmountType>::digits10);

  const int lhsNbDigitsToAdd = std::numeric_limits<UnsignedAmountType>::digits10 - ndigits(_amount);
  auto lhs = static_cast<UnsignedAmountType>(std::abs(_amount)) *
             static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(lhsNbDigitsToAdd)));
  const auto rhs = static_cast<UnsignedAmountType>(std::abs(div._amount));

  UnsignedAmountType totalIntPart = 0;
  int nbDecs = static_cast<int>(_nbDecimals) + lhsNbDigitsToAdd - static_cast<int>(div._nbDecimals);
  int totalPartNbDigits;

  while (true) {
    totalIntPart += lhs / rhs;  // Add integral part
    totalPartNbDigits = ndigits(totalIntPart);
    lhs %= rhs;  // Keep the rest
    if (lhs == 0) {
      break;
    }
    const int nbDigitsToAdd =
        std::numeric_limits<UnsignedAmountType>::digits10 - std::max(totalPartNbDigits, ndigits(lhs));
    if (nbDigitsToAdd == 0) {
      break;
    }
    const auto multPower = static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDigitsToAdd)));
    totalIntPart *= multPower;
    lhs *= multPower;
    nbDecs += nbDigitsToAdd;
  }

  if (nbDecs < 0) {
    if (std::numeric_limits<AmountType>::digits10 < totalPartNbDigits - nbDecs) {
      throw exception("Overflow during divide {} / {}", *this, div);
    }
    totalIntPart *= static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(-nbDecs)));
    nbDecs = 0;
  } else {
    const int nbDigitsTruncate = totalPartNbDigits - std::numeric_limits<AmountType>::digits10;
    if (nbDigitsTruncate > 0) {
      if (nbDecs < nbDigitsTruncate) {
        throw exception("Overflow during divide {} / {}", *this, div);
      }
      totalIntPart /= static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDigitsTruncate)));
      nbDecs -= nbDigitsTruncate;
    }
  }

  // Keep at most kMaxNbDecimals decimals
  if (nbDecs > kMaxNbDecimals) {
    totalIntPart /= static_cast<UnsignedAmountType>(ipow10(static_cast<uint8_t>(nbDecs - kMaxNbDecimals)));
    nbDecs = kMaxNbDecimals;
  }

  const auto signedResult = static_cast<AmountType>(totalIntPart);
  return {isNeg ? -signedResult : signedResult, resCurrency, static_cast<int8_t>(nbDecs)};
}

std::ostream &operator<<(std::ostream &os, const MonetaryAmount &ma) { return os << ma.str(); }

}  // namespace fxc
