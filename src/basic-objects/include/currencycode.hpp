#pragma once

#include <algorithm>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string_view>

#include "fxc_format.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxc_string.hpp"
#include "toupperlower.hpp"

namespace fxc {

/// Lightweight object representing an ISO 4217 like currency code, made of exactly 3 letters.
/// Letters are upper-cased at construction, so 'usd' and 'USD' are the same currency code.
/// Codes are packed in a 32 bits integral, one char per byte starting from the most significant one,
/// which keeps the lexicographical order for comparisons.
/// A default constructed CurrencyCode is 'neutral' (no currency).
class CurrencyCode {
 public:
  static constexpr uint32_t kAcronymLen = 3;

  /// Returns true if and only if a CurrencyCode can be constructed from 'curStr'.
  /// Note that an empty string is a valid representation of a neutral CurrencyCode.
  static constexpr bool IsValid(std::string_view curStr) noexcept {
    return curStr.empty() || (curStr.size() == kAcronymLen && std::ranges::all_of(curStr, [](char ch) {
                                return isupperalpha(ch) || isloweralpha(ch);
                              }));
  }

  /// Constructs a neutral currency code.
  constexpr CurrencyCode() noexcept = default;

  /// Constructs a currency code from a string literal.
  template <unsigned N>
    requires(N == kAcronymLen + 1U || N == 1U)
  constexpr CurrencyCode(const char (&acronym)[N]) : CurrencyCode(std::string_view(acronym, N - 1U)) {}

  /// Constructs a currency code from given string.
  /// invalid_argument is raised if it is not empty and not made of exactly 3 letters.
  constexpr CurrencyCode(std::string_view acronym) {
    if (!IsValid(acronym)) {
      throw invalid_argument("Invalid currency code '{}', expected 3 letters", acronym);
    }
    for (char ch : acronym) {
      _data = (_data << 8U) | static_cast<uint8_t>(toupper(ch));
    }
  }

  constexpr bool isNeutral() const noexcept { return _data == 0; }

  constexpr bool isDefined() const noexcept { return !isNeutral(); }

  constexpr uint32_t size() const noexcept { return isNeutral() ? 0U : kAcronymLen; }

  constexpr char operator[](uint32_t pos) const noexcept {
    return static_cast<char>((_data >> (8U * (kAcronymLen - 1U - pos))) & 0xFFU);
  }

  /// Return true if this currency code acronym is equal to given string, case insensitive.
  constexpr bool iequal(std::string_view curStr) const noexcept {
    if (curStr.size() != size()) {
      return false;
    }
    for (uint32_t charPos = 0; charPos < size(); ++charPos) {
      if ((*this)[charPos] != toupper(curStr[charPos])) {
        return false;
      }
    }
    return true;
  }

  /// Append currency string representation to given output iterator
  template <class OutputIt>
  constexpr OutputIt appendTo(OutputIt it) const {
    for (uint32_t charPos = 0; charPos < size(); ++charPos) {
      *it = (*this)[charPos];
      ++it;
    }
    return it;
  }

  /// Get a string of this CurrencyCode.
  string str() const {
    string ret(size(), '\0');
    appendTo(ret.begin());
    return ret;
  }

  constexpr uint32_t code() const noexcept { return _data; }

  constexpr std::strong_ordering operator<=>(const CurrencyCode &) const noexcept = default;

  constexpr bool operator==(const CurrencyCode &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, const CurrencyCode &cur) { return os << cur.str(); }

 private:
  uint32_t _data{};
};

}  // namespace fxc

template <>
struct fmt::formatter<fxc::CurrencyCode> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    const auto it = ctx.begin();
    const auto end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fxc::CurrencyCode &cur, FormatContext &ctx) const -> decltype(ctx.out()) {
    return cur.appendTo(ctx.out());
  }
};

// Specialize std::hash<CurrencyCode> for easy usage of CurrencyCode as unordered_map key
namespace std {
template <>
struct hash<::fxc::CurrencyCode> {
  auto operator()(const ::fxc::CurrencyCode &currencyCode) const {
    return std::hash<uint32_t>{}(currencyCode.code());
  }
};
}  // namespace std
