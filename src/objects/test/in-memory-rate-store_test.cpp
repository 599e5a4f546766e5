#include "in-memory-rate-store.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>

#include "exchange-rate.hpp"
#include "fxc_exception.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "monetaryamount.hpp"
#include "reader_mock.hpp"
#include "timedef.hpp"
#include "timestring.hpp"

namespace fxc {

using testing::Return;

class InMemoryRateStoreTest : public ::testing::Test {
 protected:
  TimePoint june1{StringToTimeISO8601UTC("2025-06-01T00:00:00Z")};
  TimePoint june15{StringToTimeISO8601UTC("2025-06-15T00:00:00Z")};
  TimePoint june30{StringToTimeISO8601UTC("2025-06-30T23:59:59Z")};
  TimePoint july1{StringToTimeISO8601UTC("2025-07-01T00:00:00Z")};
  TimePoint july31{StringToTimeISO8601UTC("2025-07-31T23:59:59Z")};

  InMemoryRateStore rateStore;
};

TEST_F(InMemoryRateStoreTest, EmptyStore) {
  EXPECT_TRUE(rateStore.empty());
  EXPECT_EQ(rateStore.currentRatePerBase("USD"), std::nullopt);
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", june15), std::nullopt);
  EXPECT_EQ(rateStore.currencyName("USD"), "");
}

TEST_F(InMemoryRateStoreTest, UnlimitedRateIsCurrent) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25")});

  EXPECT_EQ(rateStore.size(), 1U);
  EXPECT_EQ(rateStore.currentRatePerBase("USD"), MonetaryAmount("1.25"));
  EXPECT_EQ(rateStore.currentRatePerBase("usd"), MonetaryAmount("1.25"));
  EXPECT_EQ(rateStore.currentRatePerBase("EUR"), std::nullopt);
  EXPECT_EQ(rateStore.currencyName("USD"), "US Dollar");
}

TEST_F(InMemoryRateStoreTest, RatesAreStoredNeutral) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25 EUR")});

  const auto rate = rateStore.currentRatePerBase("USD");
  ASSERT_TRUE(rate.has_value());
  EXPECT_TRUE(rate->hasNeutralCurrency());
}

TEST_F(InMemoryRateStoreTest, ExpiredAndNotYetValidRatesAreNotCurrent) {
  const TimePoint now = Clock::now();
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), now - std::chrono::hours(48),
                             now - std::chrono::hours(24)});
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.27"), now + std::chrono::hours(24),
                             now + std::chrono::hours(48)});

  EXPECT_EQ(rateStore.size(), 2U);
  EXPECT_EQ(rateStore.currentRatePerBase("USD"), std::nullopt);
}

TEST_F(InMemoryRateStoreTest, RatePerBaseAt) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), june1, june30});
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.27"), july1, july31});

  EXPECT_EQ(rateStore.ratePerBaseAt("USD", june1), MonetaryAmount("1.25"));
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", june30), MonetaryAmount("1.25"));
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", july1), MonetaryAmount("1.27"));
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", june1 - seconds(1)), std::nullopt);
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", july31 + seconds(1)), std::nullopt);
}

TEST_F(InMemoryRateStoreTest, OverlappingRateIsRejected) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), june1, june30});

  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.26"), june15, july31}), rate_conflict);
  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.26"), june30, july31}), rate_conflict);
  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.26")}), rate_conflict);

  // other currencies are independent
  rateStore.add(ExchangeRate{"EUR", "Euro", MonetaryAmount("1.15"), june15, july31});

  EXPECT_EQ(rateStore.size(), 2U);
  EXPECT_EQ(rateStore.ratePerBaseAt("USD", june15), MonetaryAmount("1.25"));
}

TEST_F(InMemoryRateStoreTest, InvalidRatesAreRejected) {
  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount(0)}), invalid_argument);
  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("-1.25")}), invalid_argument);
  EXPECT_THROW(rateStore.add(ExchangeRate{"", "", MonetaryAmount("1.25")}), invalid_argument);
  EXPECT_THROW(rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), june30, june1}),
               invalid_argument);

  EXPECT_TRUE(rateStore.empty());
}

TEST_F(InMemoryRateStoreTest, OverlappingRates) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.27"), july1, july31});
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), june1, june30});

  EXPECT_EQ(rateStore.overlappingRates("USD", june15, july1).size(), 2U);
  EXPECT_EQ(rateStore.overlappingRates("USD", june15, june30).size(), 1U);
  EXPECT_TRUE(rateStore.overlappingRates("USD", july31 + seconds(1), TimePoint::max()).empty());
  EXPECT_TRUE(rateStore.overlappingRates("EUR", TimePoint::min(), TimePoint::max()).empty());
}

TEST_F(InMemoryRateStoreTest, RatesInDateRangeAreSorted) {
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.27"), july1, july31});
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.25"), june1, june30});
  rateStore.add(ExchangeRate{"USD", "US Dollar", MonetaryAmount("1.2"), TimePoint::min(), june1 - seconds(1)});

  const auto rates = rateStore.ratesInDateRange("USD", june1, july31);
  ASSERT_EQ(rates.size(), 2U);
  EXPECT_EQ(rates[0].unitsPerBase, MonetaryAmount("1.25"));
  EXPECT_EQ(rates[1].unitsPerBase, MonetaryAmount("1.27"));

  EXPECT_EQ(rateStore.ratesInDateRange("USD", june15, july31).size(), 1U);
  EXPECT_EQ(rateStore.ratesInDateRange("USD", TimePoint::min(), TimePoint::max()).size(), 3U);
}

TEST_F(InMemoryRateStoreTest, LoadFromReader) {
  MockReader reader;
  EXPECT_CALL(reader, readAll()).WillOnce(Return(R"({"rates":[
    {"currency":"USD","name":"US Dollar","unitsPerBase":"1.25","validFrom":"2025-06-01T00:00:00Z","validTo":"2025-06-30T23:59:59Z"},
    {"currency":"usd","name":"US Dollar","unitsPerBase":"1.27","validFrom":"2025-07-01"},
    {"currency":"EUR","name":"Euro","unitsPerBase":"1.15"},
    {"currency":"JPY","name":"Japanese Yen","unitsPerBase":"150.00"}
  ]})"));

  InMemoryRateStore loadedStore(reader);

  EXPECT_EQ(loadedStore.size(), 4U);
  EXPECT_EQ(loadedStore.ratePerBaseAt("USD", june15), MonetaryAmount("1.25"));
  EXPECT_EQ(loadedStore.ratePerBaseAt("USD", july31), MonetaryAmount("1.27"));
  EXPECT_EQ(loadedStore.ratePerBaseAt("USD", TimePoint::max()), MonetaryAmount("1.27"));
  EXPECT_EQ(loadedStore.currentRatePerBase("EUR"), MonetaryAmount("1.15"));
  EXPECT_EQ(loadedStore.currentRatePerBase("JPY"), MonetaryAmount(150));
  EXPECT_EQ(loadedStore.currencyName("JPY"), "Japanese Yen");
}

TEST_F(InMemoryRateStoreTest, LoadFromReaderEmptyContent) {
  MockReader reader;
  EXPECT_CALL(reader, readAll()).WillOnce(Return(""));

  EXPECT_TRUE(InMemoryRateStore(reader).empty());
}

TEST_F(InMemoryRateStoreTest, LoadFromReaderInvalidContent) {
  MockReader reader;
  EXPECT_CALL(reader, readAll())
      .WillOnce(Return(R"({"rates":[{"currency":"US","name":"US Dollar","unitsPerBase":"1.25"}]})"))
      .WillOnce(Return(R"({"rates":[{"currency":"USD","name":"US Dollar","unitsPerBase":"1,25"}]})"))
      .WillOnce(Return(R"({"rates":[{"currency":"USD","name":"US Dollar","unitsPerBase":"1.25","validTo":"June"}]})"))
      .WillOnce(Return(R"({"rates":[{"currency":"USD","name":"US Dollar","unitsPerBase":"1.25"},
                                    {"currency":"USD","name":"US Dollar","unitsPerBase":"1.26"}]})"));

  EXPECT_THROW(InMemoryRateStore{reader}, invalid_argument);
  EXPECT_THROW(InMemoryRateStore{reader}, invalid_argument);
  EXPECT_THROW(InMemoryRateStore{reader}, invalid_argument);
  EXPECT_THROW(InMemoryRateStore{reader}, rate_conflict);
}

}  // namespace fxc
