#pragma once

#include "conversionresultprinter.hpp"
#include "currency-metadata.hpp"
#include "fxconvoptions.hpp"
#include "rate-calculator.hpp"

namespace fxc {

/// Runs the conversion requested by the command line options and prints its result.
class ConversionProcessor {
 public:
  ConversionProcessor(const RateCalculator &rateCalculator, const CurrencyMetadata &currencyMetadata,
                      const ConversionResultPrinter &conversionResultPrinter)
      : _rateCalculator(rateCalculator),
        _currencyMetadata(currencyMetadata),
        _conversionResultPrinter(conversionResultPrinter) {}

  /// invalid_argument is raised for missing or malformed currency codes and amounts.
  /// Errors of RateCalculator are propagated.
  void process(const FxconvCmdLineOptions &cmdLineOptions) const;

 private:
  const RateCalculator &_rateCalculator;
  const CurrencyMetadata &_currencyMetadata;
  const ConversionResultPrinter &_conversionResultPrinter;
};

}  // namespace fxc
