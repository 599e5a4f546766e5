#include "in-memory-rate-store.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

#include "currencycode.hpp"
#include "exchange-rate.hpp"
#include "file.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxc_log.hpp"
#include "iso-currency-metadata.hpp"
#include "monetaryamount.hpp"
#include "rates-schema.hpp"
#include "read-json.hpp"
#include "reader.hpp"
#include "timedef.hpp"
#include "timestring.hpp"

namespace fxc {

namespace {

constexpr std::string_view kRatesFileName = "rates.json";

ExchangeRate ExchangeRateFromSchema(const schema::RateEntry& rateEntry) {
  ExchangeRate exchangeRate{CurrencyCode(rateEntry.currency), rateEntry.name,
                            MonetaryAmount(rateEntry.unitsPerBase, CurrencyCode())};
  if (rateEntry.validFrom) {
    exchangeRate.validFrom = StringToTimeISO8601UTC(*rateEntry.validFrom);
  }
  if (rateEntry.validTo) {
    exchangeRate.validTo = StringToTimeISO8601UTC(*rateEntry.validTo);
  }
  return exchangeRate;
}

}  // namespace

InMemoryRateStore::InMemoryRateStore(const Reader& ratesReader) {
  const auto ratesFile = ReadJsonOrThrow<schema::RatesFile>(ratesReader);

  const IsoCurrencyMetadata isoCurrencyMetadata;
  for (const schema::RateEntry& rateEntry : ratesFile.rates) {
    ExchangeRate exchangeRate = ExchangeRateFromSchema(rateEntry);
    if (!isoCurrencyMetadata.isKnown(exchangeRate.currency)) {
      log::warn("{} is not an ISO 4217 currency code", exchangeRate.currency);
    }
    add(std::move(exchangeRate));
  }

  log::debug("Loaded {} exchange rates", _nbRates);
}

void InMemoryRateStore::add(ExchangeRate exchangeRate) {
  if (exchangeRate.currency.isNeutral()) {
    throw invalid_argument("Cannot add an exchange rate without currency");
  }
  if (exchangeRate.unitsPerBase <= 0) {
    throw invalid_argument("Exchange rate of {} should be strictly positive, got {}", exchangeRate.currency,
                           exchangeRate.unitsPerBase);
  }
  if (exchangeRate.validTo < exchangeRate.validFrom) {
    throw invalid_argument("Invalid validity window of {} rate, starting at {} after its end {}",
                           exchangeRate.currency, TimeToStringIso8601UTC(exchangeRate.validFrom),
                           TimeToStringIso8601UTC(exchangeRate.validTo));
  }

  // rates are neutral amounts
  exchangeRate.unitsPerBase = exchangeRate.unitsPerBase.toNeutral();

  std::lock_guard<std::mutex> guard(_ratesMutex);

  ExchangeRates& exchangeRates = _ratesMap[exchangeRate.currency];
  const auto overlappingIt = std::ranges::find_if(exchangeRates, [&exchangeRate](const ExchangeRate& existingRate) {
    return existingRate.overlaps(exchangeRate.validFrom, exchangeRate.validTo);
  });
  if (overlappingIt != exchangeRates.end()) {
    throw rate_conflict("{} rate [{}, {}] overlaps existing one [{}, {}]", exchangeRate.currency,
                        TimeToStringIso8601UTC(exchangeRate.validFrom), TimeToStringIso8601UTC(exchangeRate.validTo),
                        TimeToStringIso8601UTC(overlappingIt->validFrom),
                        TimeToStringIso8601UTC(overlappingIt->validTo));
  }

  const auto insertIt = std::ranges::upper_bound(exchangeRates, exchangeRate.validFrom, {}, &ExchangeRate::validFrom);
  exchangeRates.insert(insertIt, std::move(exchangeRate));
  ++_nbRates;
}

std::optional<MonetaryAmount> InMemoryRateStore::ratePerBaseAt(CurrencyCode currencyCode, TimePoint timePoint) const {
  std::lock_guard<std::mutex> guard(_ratesMutex);

  const auto it = _ratesMap.find(currencyCode);
  if (it == _ratesMap.end()) {
    return std::nullopt;
  }
  const auto rateIt = std::ranges::find_if(
      it->second, [timePoint](const ExchangeRate& exchangeRate) { return exchangeRate.isValidAt(timePoint); });
  if (rateIt == it->second.end()) {
    return std::nullopt;
  }
  return rateIt->unitsPerBase;
}

InMemoryRateStore::ExchangeRates InMemoryRateStore::overlappingRates(CurrencyCode currencyCode, TimePoint from,
                                                                     TimePoint to) const {
  ExchangeRates ret;

  std::lock_guard<std::mutex> guard(_ratesMutex);

  const auto it = _ratesMap.find(currencyCode);
  if (it != _ratesMap.end()) {
    std::ranges::copy_if(it->second, std::back_inserter(ret),
                         [from, to](const ExchangeRate& exchangeRate) { return exchangeRate.overlaps(from, to); });
  }
  return ret;
}

InMemoryRateStore::ExchangeRates InMemoryRateStore::ratesInDateRange(CurrencyCode currencyCode, TimePoint from,
                                                                     TimePoint to) const {
  ExchangeRates ret;

  std::lock_guard<std::mutex> guard(_ratesMutex);

  const auto it = _ratesMap.find(currencyCode);
  if (it != _ratesMap.end()) {
    std::ranges::copy_if(it->second, std::back_inserter(ret),
                         [from, to](const ExchangeRate& exchangeRate) { return exchangeRate.isInside(from, to); });
  }
  return ret;
}

string InMemoryRateStore::currencyName(CurrencyCode currencyCode) const {
  std::lock_guard<std::mutex> guard(_ratesMutex);

  const auto it = _ratesMap.find(currencyCode);
  if (it == _ratesMap.end()) {
    return {};
  }
  const auto rateIt = std::ranges::find_if(
      it->second, [](const ExchangeRate& exchangeRate) { return !exchangeRate.currencyName.empty(); });
  return rateIt == it->second.end() ? string() : rateIt->currencyName;
}

std::size_t InMemoryRateStore::size() const {
  std::lock_guard<std::mutex> guard(_ratesMutex);
  return _nbRates;
}

File GetRatesFile(std::string_view dataDir) {
  return {dataDir, File::Type::kStatic, kRatesFileName, File::IfError::kThrow};
}

}  // namespace fxc
