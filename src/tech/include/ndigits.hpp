#pragma once

#include <concepts>
#include <cstdint>

namespace fxc {

/// Return the number of digits of given unsigned integral.
constexpr int ndigits(std::unsigned_integral auto n) noexcept {
  int nbDigits = 1;
  for (; n >= 10U; n /= 10U) {
    ++nbDigits;
  }
  return nbDigits;
}

/// Return the number of digits of given signed integral.
/// The minus sign is not counted.
constexpr int ndigits(std::signed_integral auto n) noexcept {
  int nbDigits = 1;
  for (; n >= 10 || n <= -10; n /= 10) {
    ++nbDigits;
  }
  return nbDigits;
}

}  // namespace fxc
