#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

#include "ndigits.hpp"

namespace fxc {

namespace details {

inline constexpr std::string_view kNoSeparator;

/// Storage of the concatenation of 'Strs', separated by 'Sep', computed at compile time.
/// The storage is null terminated (the null char is not part of 'value').
template <std::string_view const &Sep, std::string_view const &...Strs>
class StaticJoinedStringView {
  static constexpr std::size_t kNbStrs = sizeof...(Strs);
  static constexpr std::size_t kLen = (Strs.size() + ... + 0U) + (kNbStrs == 0U ? 0U : (kNbStrs - 1U) * Sep.size());

  static constexpr auto Join() noexcept {
    std::array<char, kLen + 1U> arr{};
    auto it = arr.begin();
    bool first = true;
    auto append = [&it, &first](std::string_view str) {
      if (!first) {
        it = std::ranges::copy(Sep, it).out;
      }
      first = false;
      it = std::ranges::copy(str, it).out;
    };
    (append(Strs), ...);
    return arr;
  }

  static constexpr auto kStorage = Join();

 public:
  static constexpr std::string_view value{kStorage.data(), kLen};
};

template <std::string_view const &Sep, const auto &strArray, typename>
struct JoinedArray;

template <std::string_view const &Sep, const auto &strArray, std::size_t... I>
struct JoinedArray<Sep, strArray, std::index_sequence<I...>> {
  static constexpr std::string_view value = StaticJoinedStringView<Sep, strArray[I]...>::value;
};

}  // namespace details

/// Concatenation of static string_views at compile time.
template <std::string_view const &...Strs>
inline constexpr std::string_view JoinStringView_v = details::StaticJoinedStringView<details::kNoSeparator, Strs...>::value;

/// Concatenation of static string_views with a separator at compile time.
template <std::string_view const &Sep, std::string_view const &...Strs>
inline constexpr std::string_view JoinStringViewWithSep_v = details::StaticJoinedStringView<Sep, Strs...>::value;

/// Concatenation of the elements of a static array of string_views with a separator at compile time.
template <std::string_view const &Sep, const auto &strArray>
inline constexpr std::string_view JoinArrayWithSep_v =
    details::JoinedArray<Sep, strArray, std::make_index_sequence<std::size(strArray)>>::value;

namespace details {

template <int64_t IntVal>
class StaticIntStringView {
  static constexpr std::size_t kLen = static_cast<std::size_t>(ndigits(IntVal) + static_cast<int>(IntVal < 0));

  static constexpr auto Write() noexcept {
    std::array<char, kLen> arr{};
    auto val = IntVal < 0 ? -IntVal : IntVal;
    for (auto it = arr.rbegin(); it != arr.rend(); ++it) {
      *it = static_cast<char>('0' + (val % 10));
      val /= 10;
    }
    if constexpr (IntVal < 0) {
      arr.front() = '-';
    }
    return arr;
  }

  static constexpr auto kStorage = Write();

 public:
  static constexpr std::string_view value{kStorage.data(), kLen};
};

template <char Char>
struct StaticCharStringView {
  static constexpr char kChar = Char;
  static constexpr std::string_view value{&kChar, 1};
};

}  // namespace details

/// Decimal representation of an integral at compile time.
template <int64_t IntVal>
inline constexpr std::string_view IntToStringView_v = details::StaticIntStringView<IntVal>::value;

template <char Char>
inline constexpr std::string_view CharToStringView_v = details::StaticCharStringView<Char>::value;

}  // namespace fxc
