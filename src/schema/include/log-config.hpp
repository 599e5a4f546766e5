#pragma once

#include <cstdint>

#include "fxc_string.hpp"

namespace fxc {
namespace schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"off"};
  int64_t maxFileSize{5L * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{10};
};

}  // namespace schema
}  // namespace fxc
