#pragma once

#include <chrono>

namespace fxc {

/// Time points of rate validity windows, in UTC.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using seconds = std::chrono::seconds;

}  // namespace fxc
