#include "commandlineoptionsparser.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <string_view>

#include "fxc_invalid_argument_exception.hpp"
#include "fxc_vector.hpp"

namespace fxc {

struct Opts {
  std::string_view stringOpt;
  std::string_view otherStringOpt;
  bool boolOpt{};
  bool otherBoolOpt{};
};

using ParserType = CommandLineOptionsParser<Opts>;

class CommandLineOptionsParserTest : public ::testing::Test {
 protected:
  CommandLineOptionsParserTest()
      : _parser({{{{"General", 1}, "--opt1", 'o', "<myValue>", "Opt1 descr"}, &Opts::stringOpt},
                 {{{"General", 1}, "--opt2", "<other>", "Opt2 descr"}, &Opts::otherStringOpt},
                 {{{"Other", 2}, "--opt3", "", "Opt3 descr"}, &Opts::otherBoolOpt},
                 {{{"General", 1}, "--help", 'h', "", "Help descr"}, &Opts::boolOpt}}) {}

  Opts createOptions(std::initializer_list<const char *> init) {
    vector<const char *> opts(init.begin(), init.end());
    return _parser.parse(opts);
  }

  ParserType _parser;
};

TEST_F(CommandLineOptionsParserTest, Basic) {
  Opts options = createOptions({"--opt1", "toto", "--help"});
  EXPECT_EQ(options.stringOpt, "toto");
  EXPECT_TRUE(options.boolOpt);
  EXPECT_TRUE(options.otherStringOpt.empty());
  EXPECT_FALSE(options.otherBoolOpt);
}

TEST_F(CommandLineOptionsParserTest, Empty) {
  Opts options = createOptions({});
  EXPECT_TRUE(options.stringOpt.empty());
  EXPECT_FALSE(options.boolOpt);
}

TEST_F(CommandLineOptionsParserTest, ShortName) {
  EXPECT_TRUE(createOptions({"-h"}).boolOpt);
  EXPECT_EQ(createOptions({"-o", "value"}).stringOpt, "value");
  EXPECT_THROW(createOptions({"-j"}), invalid_argument);
}

TEST_F(CommandLineOptionsParserTest, MissingValue) {
  EXPECT_THROW(createOptions({"--opt2", "val", "--opt1"}), invalid_argument);
}

TEST_F(CommandLineOptionsParserTest, UnknownOption) {
  EXPECT_THROW(createOptions({"--opt1", "toto", "--opts3"}), invalid_argument);
  EXPECT_THROW(createOptions({"unrelated"}), invalid_argument);
}

TEST_F(CommandLineOptionsParserTest, UnknownOptionSuggestion) {
  try {
    createOptions({"--hepl"});
    FAIL() << "Expected an invalid_argument exception";
  } catch (const invalid_argument &e) {
    EXPECT_STREQ(e.what(), "Unrecognized command-line option '--hepl' - did you mean '--help'?");
  }
}

TEST_F(CommandLineOptionsParserTest, FlagFollowedByOption) {
  Opts options = createOptions({"--opt3", "--opt1", "Opt1 value"});
  EXPECT_TRUE(options.otherBoolOpt);
  EXPECT_EQ(options.stringOpt, "Opt1 value");
}

TEST_F(CommandLineOptionsParserTest, FlagDoesNotTakeValue) {
  EXPECT_THROW(createOptions({"--opt3", "2000 EUR"}), invalid_argument);
}

TEST_F(CommandLineOptionsParserTest, DisplayHelp) {
  std::ostringstream ss;
  _parser.displayHelp("fxconv", ss);
  const auto helpStr = ss.str();
  EXPECT_TRUE(helpStr.starts_with("usage: fxconv <options>\n"));
  EXPECT_NE(helpStr.find("--opt1, -o <myValue>"), std::string::npos);
  EXPECT_NE(helpStr.find("Opt3 descr"), std::string::npos);
  // groups are printed by priority
  EXPECT_LT(helpStr.find(" General"), helpStr.find(" Other"));
}

}  // namespace fxc
