#include "iso-currency-metadata.hpp"

#include <gtest/gtest.h>

#include "currency-metadata.hpp"

namespace fxc {

TEST(IsoCurrencyMetadataTest, FractionDigits) {
  IsoCurrencyMetadata isoCurrencyMetadata;

  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("USD"), 2);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("EUR"), 2);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("GBP"), 2);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("JPY"), 0);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("KRW"), 0);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("BHD"), 3);
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("CLF"), 4);
}

TEST(IsoCurrencyMetadataTest, UnknownCurrency) {
  IsoCurrencyMetadata isoCurrencyMetadata;

  EXPECT_FALSE(isoCurrencyMetadata.isKnown("XXZ"));
  EXPECT_FALSE(isoCurrencyMetadata.isKnown(CurrencyCode()));
  EXPECT_EQ(isoCurrencyMetadata.fractionDigits("XXZ"), CurrencyMetadata::kDefaultFractionDigits);
  EXPECT_EQ(isoCurrencyMetadata.name("XXZ"), "");
}

TEST(IsoCurrencyMetadataTest, Names) {
  IsoCurrencyMetadata isoCurrencyMetadata;

  EXPECT_TRUE(isoCurrencyMetadata.isKnown("usd"));
  EXPECT_EQ(isoCurrencyMetadata.name("USD"), "US Dollar");
  EXPECT_EQ(isoCurrencyMetadata.name("EUR"), "Euro");
  EXPECT_EQ(isoCurrencyMetadata.name("JPY"), "Japanese Yen");
}

}  // namespace fxc
