#include "fxconvinfo.hpp"

#include <utility>

#include "fxc_string.hpp"
#include "fxconvoptions.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "output-type.hpp"

namespace fxc {

namespace {

schema::GeneralConfig LoadGeneralConfigAndOverrideOptionsFromCLI(const FxconvCmdLineOptions &cmdLineOptions) {
  schema::GeneralConfig generalConfig = ReadGeneralConfig(cmdLineOptions.getDataDir());

  // Override general config options from CLI
  if (!cmdLineOptions.outputType.empty()) {
    generalConfig.outputType = OutputTypeFromString(cmdLineOptions.outputType);
  }
  if (!cmdLineOptions.logConsole.empty()) {
    generalConfig.log.consoleLevel = string(cmdLineOptions.logConsole);
  }
  if (!cmdLineOptions.logFile.empty()) {
    generalConfig.log.fileLevel = string(cmdLineOptions.logFile);
  }

  return generalConfig;
}

}  // namespace

FxconvInfo FxconvInfo_Create(const FxconvCmdLineOptions &cmdLineOptions) {
  const auto dataDir = cmdLineOptions.getDataDir();

  // default loggers are used while reading the general config
  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kNo, dataDir);

  schema::GeneralConfig generalConfig = LoadGeneralConfigAndOverrideOptionsFromCLI(cmdLineOptions);

  loggingInfo = LoggingInfo(LoggingInfo::WithLoggersCreation::kYes, dataDir, generalConfig.log);

  return {dataDir, std::move(generalConfig), std::move(loggingInfo)};
}

}  // namespace fxc
