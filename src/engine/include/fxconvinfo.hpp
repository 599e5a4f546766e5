#pragma once

#include <string_view>
#include <utility>

#include "fxconvoptions.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "output-type.hpp"

namespace fxc {

/// Holds the run time configuration of fxconv: data directory, general configuration and loggers.
class FxconvInfo {
 public:
  FxconvInfo(std::string_view dataDir, schema::GeneralConfig generalConfig, LoggingInfo &&loggingInfo)
      : _dataDir(dataDir), _generalConfig(std::move(generalConfig)), _loggingInfo(std::move(loggingInfo)) {}

  std::string_view dataDir() const { return _dataDir; }

  OutputType outputType() const { return _generalConfig.outputType; }

  const schema::GeneralConfig &generalConfig() const { return _generalConfig; }

  const LoggingInfo &loggingInfo() const { return _loggingInfo; }

 private:
  std::string_view _dataDir;
  schema::GeneralConfig _generalConfig;
  LoggingInfo _loggingInfo;
};

/// Reads the general config of the data directory, overrides it with the command line options and creates the
/// loggers.
FxconvInfo FxconvInfo_Create(const FxconvCmdLineOptions &cmdLineOptions);

}  // namespace fxc
