#include "levenshteindistancecalculator.hpp"

#include <gtest/gtest.h>

namespace fxc {

TEST(LevenshteinDistanceCalculator, CornerCases) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("", "tata"), 4);
  EXPECT_EQ(calc("tutu", ""), 4);
  EXPECT_EQ(calc("", ""), 0);
}

TEST(LevenshteinDistanceCalculator, SimpleCases) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("horse", "ros"), 3);
  EXPECT_EQ(calc("intention", "execution"), 5);
}

TEST(LevenshteinDistanceCalculator, OptionNames) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("--amount", "--amout"), 1);
  EXPECT_EQ(calc("--from", "from"), 2);
  EXPECT_EQ(calc("--rate-only", "--rateonly"), 1);
  // the calculator is reused with words of various lengths
  EXPECT_EQ(calc("--to", "--to"), 0);
}

}  // namespace fxc
