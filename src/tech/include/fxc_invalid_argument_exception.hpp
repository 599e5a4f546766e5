#pragma once

#include <utility>

#include "fxc_exception.hpp"
#include "fxc_format.hpp"

namespace fxc {

/// Raised for malformed user input (currency acronyms, amount strings, command line options...).
class invalid_argument : public exception {
 public:
  template <int N>
  explicit invalid_argument(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_argument(format_string<Args...> fmt, Args&&... args) : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace fxc
