#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string_view>

#include "currencycode.hpp"
#include "fxc_log.hpp"
#include "logginginfo.hpp"
#include "monetaryamount.hpp"
#include "output-type.hpp"
#include "rate-calculator.hpp"

namespace fxc {

class ConversionResultPrinter {
 public:
  /// @brief Creates a ConversionResultPrinter that will output results in the output logger.
  explicit ConversionResultPrinter(OutputType outputType);

  /// @brief Creates a ConversionResultPrinter that will output results in given ostream
  ConversionResultPrinter(std::ostream &os, OutputType outputType);

  /// Prints the result of the conversion of 'sourceAmount'.
  /// The destination amount is written with exactly 'destinationFractionDigits' decimals.
  void printConversion(MonetaryAmount sourceAmount, CurrencyCode destinationCurrency,
                       const ConversionResult &conversionResult, int8_t destinationFractionDigits) const;

  void printRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency, MonetaryAmount rate) const;

 private:
  void print(std::string_view str) const;

  std::ostream *_pOs = nullptr;
  std::shared_ptr<log::logger> _outputLogger;
  OutputType _outputType;
};

}  // namespace fxc
