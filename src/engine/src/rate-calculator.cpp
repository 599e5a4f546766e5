#include "rate-calculator.hpp"

#include <cstdint>
#include <optional>

#include "currency-metadata.hpp"
#include "currencycode.hpp"
#include "fxc_log.hpp"
#include "monetaryamount.hpp"
#include "rate-store.hpp"

namespace fxc {

MonetaryAmount RateCalculator::ratePerBase(CurrencyCode currencyCode, CurrencyRole currencyRole) const {
  if (currencyCode == kBaseCurrency) {
    return MonetaryAmount(1);
  }
  if (currencyCode.isNeutral()) {
    throw currency_not_found(currencyCode, currencyRole);
  }
  std::optional<MonetaryAmount> optRate = _rateStore.currentRatePerBase(currencyCode);
  if (!optRate) {
    throw currency_not_found(currencyCode, currencyRole);
  }
  log::debug("{} rate of {} per {}: {}", CurrencyRoleName(currencyRole), currencyCode, kBaseCurrency, *optRate);
  return optRate->toNeutral();
}

MonetaryAmount RateCalculator::getRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency) const {
  log::info("Getting exchange rate {} -> {}", sourceCurrency, destinationCurrency);

  if (sourceCurrency == destinationCurrency && sourceCurrency.isDefined()) {
    return MonetaryAmount(1);
  }

  const MonetaryAmount sourceRatePerBase = ratePerBase(sourceCurrency, CurrencyRole::source);
  const MonetaryAmount destinationRatePerBase = ratePerBase(destinationCurrency, CurrencyRole::destination);

  return destinationRatePerBase / sourceRatePerBase;
}

MonetaryAmount RateCalculator::roundedRate(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency) const {
  MonetaryAmount rate = getRate(sourceCurrency, destinationCurrency);
  rate.round(kRatePrecision, MonetaryAmount::RoundType::kNearest);
  return rate;
}

ConversionResult RateCalculator::convert(CurrencyCode sourceCurrency, CurrencyCode destinationCurrency,
                                         MonetaryAmount amount) const {
  if (!amount.hasNeutralCurrency() && amount.currencyCode() != sourceCurrency) {
    throw invalid_amount("Amount {} is not expressed in source currency {}", amount, sourceCurrency);
  }
  if (amount < 0) {
    throw invalid_amount(amount);
  }

  const MonetaryAmount rate = roundedRate(sourceCurrency, destinationCurrency);
  const int8_t fractionDigits = _currencyMetadata.fractionDigits(destinationCurrency);

  std::optional<MonetaryAmount> optProduct =
      amount.toNeutral().multiplyAndRound(rate, fractionDigits, MonetaryAmount::RoundType::kNearest);
  if (!optProduct) {
    throw invalid_amount("Amount {} is too large to be converted into {}", amount, destinationCurrency);
  }
  const MonetaryAmount destinationAmount(*optProduct, destinationCurrency);

  log::debug("{} {} -> {} with rate {}", amount.toNeutral(), sourceCurrency, destinationAmount, rate);

  return {destinationAmount, rate};
}

}  // namespace fxc
