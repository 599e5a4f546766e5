#include "output-type.hpp"

#include <gtest/gtest.h>

#include "enum-string.hpp"
#include "fxc_invalid_argument_exception.hpp"

namespace fxc {

TEST(OutputTypeTest, FromString) {
  EXPECT_EQ(OutputTypeFromString("json"), OutputType::json);
  EXPECT_EQ(OutputTypeFromString("TEXT"), OutputType::text);
  EXPECT_EQ(OutputTypeFromString("Json"), OutputType::json);
  EXPECT_THROW(OutputTypeFromString("table"), invalid_argument);
  EXPECT_THROW(OutputTypeFromString(""), invalid_argument);
}

TEST(OutputTypeTest, ToString) {
  EXPECT_EQ(EnumToString(OutputType::text), "text");
  EXPECT_EQ(EnumToString(OutputType::json), "json");
}

}  // namespace fxc
