#pragma once

#include <string_view>

#include "commandlineoption.hpp"
#include "fxc_const.hpp"
#include "logginginfo.hpp"
#include "static-string-view.hpp"

namespace fxc {

class FxconvCmdLineOptionsDefinitions {
 public:
  static constexpr std::string_view kDataDirEnvVarName = "FXCONV_DATA_DIR";

 protected:
  static constexpr std::string_view kLogValue1 = "<levelName|0-";
  static constexpr std::string_view kLogValue =
      JoinStringView_v<kLogValue1, IntToStringView_v<LoggingInfo::kNbLogLevels - 1U>, CharToStringView_v<'>'>>;

  static constexpr std::string_view kLoggingLevelsSep = "|";
  static constexpr std::string_view kLoggingLevels = JoinArrayWithSep_v<kLoggingLevelsSep, LoggingInfo::kLogLevelNames>;

  static constexpr std::string_view kLog1 = "Sets the log level in the console. Possible values are: (";
  static constexpr std::string_view kLog2 = ") or (0-";
  static constexpr std::string_view kLog3 = ") (overrides .log.consoleLevel in general config file)";
  static constexpr std::string_view kLog =
      JoinStringView_v<kLog1, kLoggingLevels, kLog2, IntToStringView_v<LoggingInfo::kNbLogLevels - 1U>, kLog3>;

  static constexpr std::string_view kData1 = "Use given 'data' directory instead of $";
  static constexpr std::string_view kData2 = " or the one chosen at build time '";
  static constexpr std::string_view kData =
      JoinStringView_v<kData1, kDataDirEnvVarName, kData2, kDefaultDataDir, CharToStringView_v<'\''>>;
};

template <class OptValueType>
struct FxconvAllowedOptions : private FxconvCmdLineOptionsDefinitions {
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;

  static constexpr CommandLineOptionWithValue value[] = {
      {{{"General", 100}, "--help", 'h', "", "Display this information"}, &OptValueType::help},
      {{{"General", 200}, "--data", "<path/to/data>", kData}, &OptValueType::dataDir},
      {{{"General", 300}, "--log", 'v', kLogValue, kLog}, &OptValueType::logConsole},
      {{{"General", 400},
        "--log-file",
        kLogValue,
        "Sets the log level in files (overrides .log.fileLevel in general config file). "
        "Number of rotating files to keep and their size is configurable in the general config file"},
       &OptValueType::logFile},
      {{{"General", 500},
        "--output",
        'o',
        "<text|json>",
        "Output format (default configured in general config file)"},
       &OptValueType::outputType},
      {{{"General", 600}, "--version", "", "Display program version"}, &OptValueType::version},
      {{{"Conversion", 1000}, "--from", 'f', "<cur>", "Currency code to convert from, for instance 'USD'"},
       &OptValueType::from},
      {{{"Conversion", 1000}, "--to", 't', "<cur>", "Currency code to convert to, for instance 'EUR'"},
       &OptValueType::to},
      {{{"Conversion", 1000},
        "--amount",
        'a',
        "<decimal>",
        "Positive amount of the source currency to convert, for instance '100.50'"},
       &OptValueType::amount},
      {{{"Conversion", 1100},
        "--rate-only",
        "",
        "Only print the exchange rate from the source to the destination currency, without amount"},
       &OptValueType::rateOnly},
  };
};

}  // namespace fxc
