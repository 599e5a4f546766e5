#include "timestring.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

#include "fxc_config.hpp"
#include "fxc_format.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxc_string.hpp"
#include "timedef.hpp"

namespace fxc {
namespace {

int ParseDigits(std::string_view timeStr, std::size_t pos, std::size_t nbDigits) {
  int ret = 0;
  for (std::size_t charPos = pos; charPos < pos + nbDigits; ++charPos) {
    const char ch = timeStr[charPos];
    if (ch < '0' || ch > '9') {
      throw invalid_argument("Unexpected char '{}' in time string '{}'", ch, timeStr);
    }
    ret = (ret * 10) + (ch - '0');
  }
  return ret;
}

void ExpectChar(std::string_view timeStr, std::size_t pos, std::string_view possibleChars) {
  if (possibleChars.find(timeStr[pos]) == std::string_view::npos) {
    throw invalid_argument("Unexpected char '{}' at position {} in time string '{}'", timeStr[pos], pos, timeStr);
  }
}

}  // namespace

string TimeToStringIso8601UTC(TimePoint timePoint) {
  if (timePoint == TimePoint::min()) {
    return "-inf";
  }
  if (timePoint == TimePoint::max()) {
    return "+inf";
  }
  const auto days = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hhMmSs{std::chrono::floor<seconds>(timePoint - days)};

  return format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), hhMmSs.hours().count(),
                hhMmSs.minutes().count(), hhMmSs.seconds().count());
}

TimePoint StringToTimeISO8601UTC(std::string_view timeStr) {
  static constexpr std::size_t kDateLen = 10;
  static constexpr std::size_t kDateTimeLen = 19;

  if (!timeStr.empty() && timeStr.back() == 'Z') {
    // consider UTC anyways
    timeStr.remove_suffix(1);
  }
  if (FXC_UNLIKELY(timeStr.size() != kDateLen && timeStr.size() != kDateTimeLen)) {
    throw invalid_argument("Time string '{}' should be formatted as YYYY-MM-DDTHH:MM:SSZ", timeStr);
  }

  ExpectChar(timeStr, 4, "-");
  ExpectChar(timeStr, 7, "-");

  const std::chrono::year_month_day ymd{std::chrono::year(ParseDigits(timeStr, 0, 4)),
                                        std::chrono::month(static_cast<unsigned>(ParseDigits(timeStr, 5, 2))),
                                        std::chrono::day(static_cast<unsigned>(ParseDigits(timeStr, 8, 2)))};
  if (!ymd.ok()) {
    throw invalid_argument("Invalid date in time string '{}'", timeStr);
  }

  TimePoint ts = std::chrono::sys_days{ymd};

  if (timeStr.size() == kDateTimeLen) {
    ExpectChar(timeStr, 10, "T ");
    ExpectChar(timeStr, 13, ":");
    ExpectChar(timeStr, 16, ":");

    const int hours = ParseDigits(timeStr, 11, 2);
    const int minutes = ParseDigits(timeStr, 14, 2);
    const int secs = ParseDigits(timeStr, 17, 2);
    if (hours > 23 || minutes > 59 || secs > 59) {
      throw invalid_argument("Invalid time of day in time string '{}'", timeStr);
    }
    ts += std::chrono::hours{hours} + std::chrono::minutes{minutes} + seconds{secs};
  }

  return ts;
}

}  // namespace fxc
