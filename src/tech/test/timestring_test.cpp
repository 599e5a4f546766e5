#include "timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "fxc_invalid_argument_exception.hpp"
#include "timedef.hpp"

namespace fxc {

TEST(TimeStringTest, ParseFullDateTime) {
  const TimePoint tp = StringToTimeISO8601UTC("2025-06-01T12:34:56Z");
  EXPECT_EQ(tp.time_since_epoch(), seconds(1748781296));
  EXPECT_EQ(StringToTimeISO8601UTC("2025-06-01 12:34:56"), tp);
  EXPECT_EQ(StringToTimeISO8601UTC("2025-06-01T12:34:56"), tp);
}

TEST(TimeStringTest, ParseDateOnly) {
  EXPECT_EQ(StringToTimeISO8601UTC("2025-06-01"), StringToTimeISO8601UTC("2025-06-01T00:00:00Z"));
}

TEST(TimeStringTest, ParseInvalid) {
  EXPECT_THROW(StringToTimeISO8601UTC(""), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025/06/01"), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025-13-01"), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025-02-30"), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025-06-01T24:00:00Z"), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025-06-01X12:00:00Z"), invalid_argument);
  EXPECT_THROW(StringToTimeISO8601UTC("2025-06-0a"), invalid_argument);
}

TEST(TimeStringTest, RoundTrip) {
  static constexpr std::string_view kTimeStr = "2025-06-30T23:59:59Z";
  EXPECT_EQ(TimeToStringIso8601UTC(StringToTimeISO8601UTC(kTimeStr)), kTimeStr);
}

TEST(TimeStringTest, Infinite) {
  EXPECT_EQ(TimeToStringIso8601UTC(TimePoint::min()), "-inf");
  EXPECT_EQ(TimeToStringIso8601UTC(TimePoint::max()), "+inf");
}

}  // namespace fxc
