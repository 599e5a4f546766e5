#include "levenshteindistancecalculator.hpp"

#include <algorithm>
#include <numeric>
#include <string_view>
#include <utility>

namespace fxc {

int LevenshteinDistanceCalculator::operator()(std::string_view word1, std::string_view word2) {
  if (word1.size() > word2.size()) {
    std::swap(word1, word2);
  }

  const auto len1 = word1.size() + 1U;
  if (len1 > _minDistance.size()) {
    _minDistance.resize(len1);
  }

  std::iota(_minDistance.begin(), _minDistance.begin() + static_cast<std::ptrdiff_t>(len1), 0);

  for (std::size_t word2Pos = 1; word2Pos <= word2.size(); ++word2Pos) {
    int previousDiagonal = _minDistance[0];

    ++_minDistance[0];

    for (std::size_t word1Pos = 1; word1Pos < len1; ++word1Pos) {
      const int savedDistance = _minDistance[word1Pos];
      if (word1[word1Pos - 1] == word2[word2Pos - 1]) {
        _minDistance[word1Pos] = previousDiagonal;
      } else {
        _minDistance[word1Pos] = std::min({_minDistance[word1Pos - 1], _minDistance[word1Pos], previousDiagonal}) + 1;
      }
      previousDiagonal = savedDistance;
    }
  }

  return _minDistance[len1 - 1];
}

}  // namespace fxc
