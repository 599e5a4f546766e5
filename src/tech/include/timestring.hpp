#pragma once

#include <string_view>

#include "fxc_string.hpp"
#include "timedef.hpp"

namespace fxc {

/// Get a string representation of a given time point in ISO 8601 UTC format: 'YYYY-MM-DDTHH:MM:SSZ'.
/// The minimum and maximum time points are printed as '-inf' and '+inf' respectively.
string TimeToStringIso8601UTC(TimePoint timePoint);

/// Parse a string representation of a given time point in ISO 8601 UTC format and return a time_point.
/// Accepted formats are (even without trailing Z, the time will be considered UTC):
///   - 'YYYY-MM-DDTHH:MM:SSZ'
///   - 'YYYY-MM-DD HH:MM:SS'
///   - 'YYYY-MM-DD' (start of the day)
/// invalid_argument is raised if the string does not match one of these formats.
TimePoint StringToTimeISO8601UTC(std::string_view timeStr);

}  // namespace fxc
