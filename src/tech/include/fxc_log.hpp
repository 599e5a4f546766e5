#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <cstdint>

namespace fxc {

namespace log = spdlog;

/// Position of a log level, from 0 (off) to 6 (trace).
/// It is the reverse order of spdlog levels, which is more natural for a verbosity.
constexpr int8_t PosFromLevel(log::level::level_enum level) {
  return static_cast<int8_t>(log::level::off) - static_cast<int8_t>(level);
}

constexpr log::level::level_enum LevelFromPos(int8_t levelPos) {
  return static_cast<log::level::level_enum>(static_cast<int8_t>(log::level::off) - levelPos);
}

}  // namespace fxc
