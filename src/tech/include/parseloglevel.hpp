#pragma once

#include <cstdint>
#include <string_view>

namespace fxc {

/// Parses a log level given either by its name (off|critical|error|warning|info|debug|trace) or by its position (0-6).
/// Returns its position, 0 being 'off' and 6 'trace'.
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace fxc
