#pragma once

#include <cstdint>
#include <string_view>

#include "fxc_json.hpp"

namespace fxc {

#define FXC_OUTPUT_TYPES text, json

/// How conversion results are printed on the standard output.
enum class OutputType : int8_t { FXC_OUTPUT_TYPES };

OutputType OutputTypeFromString(std::string_view str);

}  // namespace fxc

template <>
struct glz::meta<::fxc::OutputType> {
  using enum ::fxc::OutputType;
  static constexpr auto value = enumerate(FXC_OUTPUT_TYPES);
};

#undef FXC_OUTPUT_TYPES
