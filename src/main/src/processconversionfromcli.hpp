#pragma once

#include "fxconvoptions.hpp"

namespace fxc {

/// Runs the conversion requested on the command line, reading the rates from the data directory.
/// Errors are logged at critical level before being propagated.
void ProcessConversionFromCLI(const FxconvCmdLineOptions &cmdLineOptions);

}  // namespace fxc
