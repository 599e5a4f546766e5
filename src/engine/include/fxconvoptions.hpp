#pragma once

#include <ostream>
#include <string_view>

#include "fxconvoptionsdef.hpp"

namespace fxc {

class FxconvCmdLineOptions {
 public:
  static std::ostream& PrintVersion(std::string_view programName, std::ostream& os) noexcept;

  /// Get the data directory from the environment variable FXCONV_DATA_DIR, or the one chosen at build time.
  static std::string_view SelectDefaultDataDir() noexcept;

  constexpr FxconvCmdLineOptions() noexcept = default;

  std::string_view getDataDir() const { return dataDir.empty() ? SelectDefaultDataDir() : dataDir; }

  /// Checks that the options needed for a conversion are present.
  /// invalid_argument is raised otherwise.
  void checkConversionOptions() const;

  bool operator==(const FxconvCmdLineOptions&) const noexcept = default;

  std::string_view dataDir;

  std::string_view logConsole;
  std::string_view logFile;
  std::string_view outputType;

  std::string_view from;
  std::string_view to;
  std::string_view amount;

  bool rateOnly = false;
  bool help = false;
  bool version = false;
};

}  // namespace fxc
