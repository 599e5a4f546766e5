#pragma once

#include <gmock/gmock.h>

#include <cstdint>

#include "currency-metadata.hpp"
#include "currencycode.hpp"

namespace fxc {

class MockCurrencyMetadata : public CurrencyMetadata {
 public:
  MOCK_METHOD(int8_t, fractionDigits, (CurrencyCode), (const override));
};

}  // namespace fxc
