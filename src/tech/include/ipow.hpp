#pragma once

#include <cstdint>
#include <limits>

namespace fxc {

/// Optimization of ipow(10, uint8_t exp).
/// Returns the max of int64_t if the result does not fit in a 64 bits signed integral.
constexpr int64_t ipow10(uint8_t exp) noexcept {
  constexpr const int64_t kPow10Table[] = {1LL,
                                           10LL,
                                           100LL,
                                           1000LL,
                                           10000LL,
                                           100000LL,
                                           1000000LL,
                                           10000000LL,
                                           100000000LL,
                                           1000000000LL,
                                           10000000000LL,
                                           100000000000LL,
                                           1000000000000LL,
                                           10000000000000LL,
                                           100000000000000LL,
                                           1000000000000000LL,
                                           10000000000000000LL,
                                           100000000000000000LL,
                                           1000000000000000000LL};
  return exp < sizeof(kPow10Table) / sizeof(kPow10Table[0]) ? kPow10Table[exp] : std::numeric_limits<int64_t>::max();
}

}  // namespace fxc
