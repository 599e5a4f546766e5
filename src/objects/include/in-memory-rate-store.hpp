#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "currencycode.hpp"
#include "exchange-rate.hpp"
#include "file.hpp"
#include "fxc_exception.hpp"
#include "fxc_format.hpp"
#include "fxc_string.hpp"
#include "fxc_vector.hpp"
#include "monetaryamount.hpp"
#include "rate-store.hpp"
#include "reader.hpp"
#include "timedef.hpp"

namespace fxc {

/// Raised when a new exchange rate has a validity window overlapping one of an existing rate of the same currency.
class rate_conflict : public exception {
 public:
  template <typename... Args>
  explicit rate_conflict(format_string<Args...> fmt, Args&&... args) : exception(fmt, std::forward<Args>(args)...) {}
};

/// Rate store keeping all exchange rates in memory, with their validity windows.
/// Rates of a given currency never overlap in time, so at most one of them is valid at a given time.
///
/// All methods are thread safe.
class InMemoryRateStore : public RateStore {
 public:
  using ExchangeRates = vector<ExchangeRate>;

  InMemoryRateStore() = default;

  /// Creates a rate store loaded from the json content of given reader (see schema::RatesFile).
  /// exception is raised if the content is invalid or if some rates overlap.
  explicit InMemoryRateStore(const Reader& ratesReader);

  /// Adds a new exchange rate.
  /// invalid_argument is raised if the rate is not strictly positive, if its currency is neutral or if its window is
  /// empty. rate_conflict is raised if it overlaps an existing rate of the same currency.
  void add(ExchangeRate exchangeRate);

  /// Get the rate of given currency valid at 'timePoint', if any.
  [[nodiscard]] std::optional<MonetaryAmount> ratePerBaseAt(CurrencyCode currencyCode, TimePoint timePoint) const;

  [[nodiscard]] std::optional<MonetaryAmount> currentRatePerBase(CurrencyCode currencyCode) const override {
    return ratePerBaseAt(currencyCode, Clock::now());
  }

  /// Get the rates of given currency whose validity window intersects [from, to].
  [[nodiscard]] ExchangeRates overlappingRates(CurrencyCode currencyCode, TimePoint from, TimePoint to) const;

  /// Get the rates of given currency whose validity window is fully inside [from, to], sorted by start time.
  [[nodiscard]] ExchangeRates ratesInDateRange(CurrencyCode currencyCode, TimePoint from, TimePoint to) const;

  /// Get the name of the currency as recorded with its rates, or an empty string if unknown.
  [[nodiscard]] string currencyName(CurrencyCode currencyCode) const;

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] bool empty() const { return size() == 0; }

 private:
  // Rates of each currency are kept sorted by start of validity
  using RatesMap = std::unordered_map<CurrencyCode, ExchangeRates>;

  RatesMap _ratesMap;
  std::size_t _nbRates = 0;
  mutable std::mutex _ratesMutex;
};

/// Get the rates file of the data directory.
File GetRatesFile(std::string_view dataDir);

}  // namespace fxc
