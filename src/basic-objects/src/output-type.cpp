#include "output-type.hpp"

#include <string_view>

#include "enum-string.hpp"

namespace fxc {

OutputType OutputTypeFromString(std::string_view str) { return EnumFromStringCaseInsensitive<OutputType>(str); }

}  // namespace fxc
