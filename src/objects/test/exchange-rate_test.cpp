#include "exchange-rate.hpp"

#include <gtest/gtest.h>

#include "monetaryamount.hpp"
#include "timedef.hpp"
#include "timestring.hpp"

namespace fxc {

class ExchangeRateTest : public ::testing::Test {
 protected:
  TimePoint tp1{StringToTimeISO8601UTC("2025-06-01T00:00:00Z")};
  TimePoint tp2{StringToTimeISO8601UTC("2025-06-15T00:00:00Z")};
  TimePoint tp3{StringToTimeISO8601UTC("2025-06-30T23:59:59Z")};
  TimePoint tp4{StringToTimeISO8601UTC("2025-07-01T00:00:00Z")};

  ExchangeRate exchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), tp1, tp3};
};

TEST_F(ExchangeRateTest, DefaultWindowIsUnlimited) {
  ExchangeRate unlimitedRate{"EUR", "Euro", MonetaryAmount("1.15")};

  EXPECT_TRUE(unlimitedRate.isValidAt(TimePoint::min()));
  EXPECT_TRUE(unlimitedRate.isValidAt(tp2));
  EXPECT_TRUE(unlimitedRate.isValidAt(TimePoint::max()));
}

TEST_F(ExchangeRateTest, IsValidAtInclusiveBounds) {
  EXPECT_TRUE(exchangeRate.isValidAt(tp1));
  EXPECT_TRUE(exchangeRate.isValidAt(tp2));
  EXPECT_TRUE(exchangeRate.isValidAt(tp3));
  EXPECT_FALSE(exchangeRate.isValidAt(tp1 - seconds(1)));
  EXPECT_FALSE(exchangeRate.isValidAt(tp4));
}

TEST_F(ExchangeRateTest, Overlaps) {
  EXPECT_TRUE(exchangeRate.overlaps(tp2, tp4));
  EXPECT_TRUE(exchangeRate.overlaps(TimePoint::min(), tp1));
  EXPECT_TRUE(exchangeRate.overlaps(tp3, tp4));
  EXPECT_FALSE(exchangeRate.overlaps(tp4, TimePoint::max()));
  EXPECT_FALSE(exchangeRate.overlaps(TimePoint::min(), tp1 - seconds(1)));
}

TEST_F(ExchangeRateTest, IsInside) {
  EXPECT_TRUE(exchangeRate.isInside(tp1, tp3));
  EXPECT_TRUE(exchangeRate.isInside(TimePoint::min(), tp4));
  EXPECT_FALSE(exchangeRate.isInside(tp2, tp4));
  EXPECT_FALSE(exchangeRate.isInside(tp1, tp2));
}

}  // namespace fxc
