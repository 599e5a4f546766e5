#pragma once

#include <string_view>

#include "fxc_vector.hpp"

namespace fxc {

/// Computes edit distances between words, used to suggest the closest command line option name.
class LevenshteinDistanceCalculator {
 public:
  LevenshteinDistanceCalculator() noexcept = default;

  /// Computes the levenshtein distance between both input words.
  /// Complexity is in 'word1.length() * word2.length()' in time,
  /// min(word1.length(), word2.length()) in space.
  int operator()(std::string_view word1, std::string_view word2);

 private:
  // reused between calls so that repeated distance calculations do not allocate each time
  vector<int> _minDistance;
};

}  // namespace fxc
