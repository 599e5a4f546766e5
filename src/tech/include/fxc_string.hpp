#pragma once

#include <string>

namespace fxc {

using string = std::string;

}  // namespace fxc
