#include "parseoptions.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <sstream>
#include <string_view>

#include "commandlineoptionsparser.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxconvoptions.hpp"
#include "fxconvoptionsdef.hpp"

namespace fxc {

class ParseOptionsTest : public ::testing::Test {
 protected:
  template <std::size_t N>
  auto parse(const char *(&argv)[N]) {
    return ParseOptions(parser, static_cast<int>(N), argv, os);
  }

  CommandLineOptionsParser<FxconvCmdLineOptions> parser{FxconvAllowedOptions<FxconvCmdLineOptions>::value};
  std::ostringstream os;
};

TEST_F(ParseOptionsTest, NoArgumentPrintsHelp) {
  const char *argv[] = {"/usr/local/bin/fxconv"};
  const auto parsedOptions = parse(argv);

  EXPECT_EQ(parsedOptions.programName, "fxconv");
  EXPECT_FALSE(parsedOptions.options.has_value());
  EXPECT_TRUE(os.view().starts_with("usage: fxconv <options>"));
}

TEST_F(ParseOptionsTest, Help) {
  const char *argv[] = {"fxconv", "--from", "USD", "-h"};
  const auto parsedOptions = parse(argv);

  EXPECT_FALSE(parsedOptions.options.has_value());
  EXPECT_NE(os.view().find("--amount"), std::string_view::npos);
}

TEST_F(ParseOptionsTest, Version) {
  const char *argv[] = {"fxconv", "--version"};
  const auto parsedOptions = parse(argv);

  EXPECT_FALSE(parsedOptions.options.has_value());
  EXPECT_TRUE(os.view().starts_with("fxconv version "));
}

TEST_F(ParseOptionsTest, Conversion) {
  const char *argv[] = {"./fxconv", "--from", "USD", "--to", "EUR", "--amount", "100"};
  const auto parsedOptions = parse(argv);

  ASSERT_TRUE(parsedOptions.options.has_value());
  EXPECT_EQ(parsedOptions.options->from, "USD");
  EXPECT_EQ(parsedOptions.options->to, "EUR");
  EXPECT_EQ(parsedOptions.options->amount, "100");
  EXPECT_TRUE(os.view().empty());
}

TEST_F(ParseOptionsTest, InvalidOption) {
  const char *argv[] = {"fxconv", "--ammount", "100"};
  EXPECT_THROW(parse(argv), invalid_argument);
}

}  // namespace fxc
