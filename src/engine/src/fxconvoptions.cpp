#include "fxconvoptions.hpp"

#include <spdlog/version.h>

#include <cstdlib>
#include <ostream>
#include <string_view>

#include "fxc_config.hpp"
#include "fxc_const.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxconvoptionsdef.hpp"

namespace fxc {

std::string_view FxconvCmdLineOptions::SelectDefaultDataDir() noexcept {
  const char* pDataDirEnvValue = std::getenv(FxconvCmdLineOptionsDefinitions::kDataDirEnvVarName.data());
  if (pDataDirEnvValue != nullptr && *pDataDirEnvValue != '\0') {
    return pDataDirEnvValue;
  }
  return kDefaultDataDir;
}

std::ostream& FxconvCmdLineOptions::PrintVersion(std::string_view programName, std::ostream& os) noexcept {
  os << programName << " version " << FXC_VERSION << '\n';
  os << "compiled with " << FXC_COMPILER_VERSION << " on " << __DATE__ << " at " << __TIME__ << '\n';
  os << "              spdlog " << SPDLOG_VER_MAJOR << '.' << SPDLOG_VER_MINOR << '.' << SPDLOG_VER_PATCH << '\n';
  return os;
}

void FxconvCmdLineOptions::checkConversionOptions() const {
  if (from.empty()) {
    throw invalid_argument("Source currency is required (--from)");
  }
  if (to.empty()) {
    throw invalid_argument("Destination currency is required (--to)");
  }
  if (amount.empty() && !rateOnly) {
    throw invalid_argument("Source amount is required (--amount)");
  }
}

}  // namespace fxc
