#include "conversionprocessor.hpp"

#include "conversionresultprinter.hpp"
#include "currency-metadata.hpp"
#include "currencycode.hpp"
#include "fxc_log.hpp"
#include "fxconvoptions.hpp"
#include "monetaryamount.hpp"
#include "rate-calculator.hpp"

namespace fxc {

void ConversionProcessor::process(const FxconvCmdLineOptions &cmdLineOptions) const {
  cmdLineOptions.checkConversionOptions();

  const CurrencyCode sourceCurrency(cmdLineOptions.from);
  const CurrencyCode destinationCurrency(cmdLineOptions.to);

  if (cmdLineOptions.rateOnly) {
    const MonetaryAmount rate = _rateCalculator.roundedRate(sourceCurrency, destinationCurrency);
    _conversionResultPrinter.printRate(sourceCurrency, destinationCurrency, rate);
    return;
  }

  const MonetaryAmount sourceAmount(cmdLineOptions.amount, sourceCurrency);

  const ConversionResult conversionResult = _rateCalculator.convert(sourceCurrency, destinationCurrency, sourceAmount);

  _conversionResultPrinter.printConversion(sourceAmount, destinationCurrency, conversionResult,
                                           _currencyMetadata.fractionDigits(destinationCurrency));

  log::debug("Converted {} into {}", sourceAmount, conversionResult.destinationAmount);
}

}  // namespace fxc
