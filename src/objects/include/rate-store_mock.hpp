#pragma once

#include <gmock/gmock.h>

#include <optional>

#include "currencycode.hpp"
#include "monetaryamount.hpp"
#include "rate-store.hpp"

namespace fxc {

class MockRateStore : public RateStore {
 public:
  MOCK_METHOD(std::optional<MonetaryAmount>, currentRatePerBase, (CurrencyCode), (const override));
};

}  // namespace fxc
