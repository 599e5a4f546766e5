#include "conversionresultprinter.hpp"

#include <cstdint>
#include <ostream>
#include <string_view>

#include "currencycode.hpp"
#include "fxc_exception.hpp"
#include "fxc_format.hpp"
#include "fxc_log.hpp"
#include "fxc_string.hpp"
#include "logginginfo.hpp"
#include "monetaryamount.hpp"
#include "output-type.hpp"
#include "query-result-schema.hpp"
#include "rate-calculator.hpp"
#include "write-json.hpp"

namespace fxc {

ConversionResultPrinter::ConversionResultPrinter(OutputType outputType)
    : _outputLogger(log::get(LoggingInfo::kOutputLoggerName)), _outputType(outputType) {
  if (!_outputLogger) {
    throw exception("Output logger is not created");
  }
}

ConversionResultPrinter::ConversionResultPrinter(std::ostream &os, OutputType outputType)
    : _pOs(&os), _outputType(outputType) {}

void ConversionResultPrinter::printConversion(MonetaryAmount sourceAmount, CurrencyCode destinationCurrency,
                                              const ConversionResult &conversionResult,
                                              int8_t destinationFractionDigits) const {
  const string destinationAmountStr = conversionResult.destinationAmount.amountStr(destinationFractionDigits);
  switch (_outputType) {
    case OutputType::text: {
      print(fxc::format("{} -> {} {} (rate {})", sourceAmount, destinationAmountStr, destinationCurrency,
                        conversionResult.exchangeRate));
      break;
    }
    case OutputType::json: {
      schema::queryresult::Conversion conversion{sourceAmount.currencyCode().str(), destinationCurrency.str(),
                                                 sourceAmount.amountStr(), destinationAmountStr,
                                                 conversionResult.exchangeRate.amountStr()};
      print(WriteJsonOrThrow(conversion));
      break;
    }
    default:
      throw exception("Unknown output type {}", static_cast<int>(_outputType));
  }
}

void ConversionResultPrinter::printRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency,
                                        MonetaryAmount rate) const {
  switch (_outputType) {
    case OutputType::text:
      print(rate.amountStr());
      break;
    case OutputType::json: {
      schema::queryresult::Rate rateOutput{sourceCurrency.str(), destinationCurrency.str(), rate.amountStr()};
      print(WriteJsonOrThrow(rateOutput));
      break;
    }
    default:
      throw exception("Unknown output type {}", static_cast<int>(_outputType));
  }
}

void ConversionResultPrinter::print(std::string_view str) const {
  if (_pOs != nullptr) {
    *_pOs << str << '\n';
  } else {
    // logger library automatically adds a newline as suffix
    _outputLogger->info(str);
  }
}

}  // namespace fxc
