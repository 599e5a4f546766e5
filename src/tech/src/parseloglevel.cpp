#include "parseloglevel.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string_view>

#include "fxc_invalid_argument_exception.hpp"

namespace fxc {
namespace {
constexpr std::string_view kLogLevelNames[] = {"off", "critical", "error", "warning", "info", "debug", "trace"};
constexpr int8_t kMaxLogLevelPos = static_cast<int8_t>(std::size(kLogLevelNames) - 1U);
}  // namespace

int8_t LogPosFromLogStr(std::string_view logStr) {
  if (logStr.size() == 1) {
    const int8_t logLevelPos = static_cast<int8_t>(logStr.front() - '0');
    if (logLevelPos < 0 || logLevelPos > kMaxLogLevelPos) {
      throw invalid_argument("Unrecognized log level {}. Possible values are 0-{}", logStr, kMaxLogLevelPos);
    }
    return logLevelPos;
  }
  const auto it = std::ranges::find(kLogLevelNames, logStr);
  if (it == std::end(kLogLevelNames)) {
    throw invalid_argument(
        "Unrecognized log level name {}. Possible values are off|critical|error|warning|info|debug|trace", logStr);
  }
  return static_cast<int8_t>(it - std::begin(kLogLevelNames));
}

}  // namespace fxc
