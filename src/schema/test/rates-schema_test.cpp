#include "rates-schema.hpp"

#include <gtest/gtest.h>

#include "fxc_exception.hpp"
#include "read-json.hpp"
#include "write-json.hpp"

namespace fxc::schema {

TEST(RatesSchemaTest, Read) {
  auto ratesFile = ReadJsonOrThrow<RatesFile>(R"({"rates":[
    {"currency":"USD","name":"US Dollar","unitsPerBase":"1.25","validFrom":"2025-06-01T00:00:00Z","validTo":"2025-06-30T23:59:59Z"},
    {"currency":"JPY","name":"Japanese Yen","unitsPerBase":"150.00"}
  ]})");

  ASSERT_EQ(ratesFile.rates.size(), 2U);

  const auto &usd = ratesFile.rates[0];
  EXPECT_EQ(usd.currency, "USD");
  EXPECT_EQ(usd.name, "US Dollar");
  EXPECT_EQ(usd.unitsPerBase, "1.25");
  ASSERT_TRUE(usd.validFrom.has_value());
  EXPECT_EQ(*usd.validFrom, "2025-06-01T00:00:00Z");
  ASSERT_TRUE(usd.validTo.has_value());
  EXPECT_EQ(*usd.validTo, "2025-06-30T23:59:59Z");

  const auto &jpy = ratesFile.rates[1];
  EXPECT_EQ(jpy.unitsPerBase, "150.00");
  EXPECT_FALSE(jpy.validFrom.has_value());
  EXPECT_FALSE(jpy.validTo.has_value());
}

TEST(RatesSchemaTest, EmptyContent) { EXPECT_TRUE(ReadJsonOrThrow<RatesFile>("").rates.empty()); }

TEST(RatesSchemaTest, UnknownKeyThrows) {
  EXPECT_THROW(ReadJsonOrThrow<RatesFile>(R"({"rates":[{"currency":"USD","rate":"1.25"}]})"), exception);
}

TEST(RatesSchemaTest, WriteSkipsAbsentBounds) {
  RatesFile ratesFile;
  ratesFile.rates.push_back(RateEntry{"EUR", "Euro", "1.15", {}, {}});

  EXPECT_EQ(WriteJsonOrThrow(ratesFile), R"({"rates":[{"currency":"EUR","name":"Euro","unitsPerBase":"1.15"}]})");
}

}  // namespace fxc::schema
