#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>
#include <type_traits>

#include "fxc_invalid_argument_exception.hpp"
#include "fxc_json.hpp"
#include "fxc_string.hpp"
#include "string-equal-ignore-case.hpp"

namespace fxc {

/**
 * Get the string representation of an enum value, provided that enum values are contiguous and start at 0, and that
 * they are specialized with glz::meta.
 */
constexpr std::string_view EnumToString(auto enumValue) {
  using T = std::remove_cvref_t<decltype(enumValue)>;
  static_assert(std::is_enum_v<T>, "EnumToString can only be used with enum types");
  return json::reflect<T>::keys[static_cast<std::size_t>(enumValue)];
}

/**
 * Converts a string to an enum value, ignoring case, with the same requirements as EnumToString.
 * invalid_argument is raised if the string does not match any value.
 */
template <class EnumT>
  requires(std::is_enum_v<EnumT>)
EnumT EnumFromStringCaseInsensitive(std::string_view str) {
  const auto &keys = json::reflect<EnumT>::keys;
  const auto it =
      std::ranges::find_if(keys, [str](std::string_view key) { return CaseInsensitiveEqual(key, str); });
  if (it == std::end(keys)) {
    string allKeys;
    for (std::string_view key : keys) {
      if (!allKeys.empty()) {
        allKeys.push_back('|');
      }
      allKeys.append(key);
    }
    throw invalid_argument("Bad enum value '{}' among {}", str, allKeys);
  }
  return static_cast<EnumT>(it - std::begin(keys));
}

}  // namespace fxc
