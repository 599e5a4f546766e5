#include "processconversionfromcli.hpp"

#include <exception>

#include "conversionprocessor.hpp"
#include "conversionresultprinter.hpp"
#include "fxc_log.hpp"
#include "fxconvinfo.hpp"
#include "fxconvoptions.hpp"
#include "in-memory-rate-store.hpp"
#include "iso-currency-metadata.hpp"
#include "rate-calculator.hpp"

namespace fxc {

void ProcessConversionFromCLI(const FxconvCmdLineOptions &cmdLineOptions) {
  // loggers live as long as fxconvInfo, so errors below can still be logged
  const FxconvInfo fxconvInfo = FxconvInfo_Create(cmdLineOptions);

  try {
    const InMemoryRateStore rateStore(GetRatesFile(fxconvInfo.dataDir()));
    const IsoCurrencyMetadata isoCurrencyMetadata;
    const RateCalculator rateCalculator(rateStore, isoCurrencyMetadata);
    const ConversionResultPrinter conversionResultPrinter(fxconvInfo.outputType());

    ConversionProcessor(rateCalculator, isoCurrencyMetadata, conversionResultPrinter).process(cmdLineOptions);

    log::debug("Conversion done");
  } catch (const std::exception &e) {
    log::critical("{}", e.what());
    throw;
  }
}

}  // namespace fxc
