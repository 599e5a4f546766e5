#pragma once

#include <string_view>

namespace fxc {

static constexpr std::string_view kDefaultDataDir = FXC_DATA_DIR;

}  // namespace fxc
