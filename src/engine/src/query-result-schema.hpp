#pragma once

#include "fxc_string.hpp"

namespace fxc::schema::queryresult {

/// Amounts and rates are decimal strings, to keep their exact representation.
struct Conversion {
  string sourceCurrency;
  string destinationCurrency;
  string sourceAmount;
  string destinationAmount;
  string exchangeRate;
};

struct Rate {
  string sourceCurrency;
  string destinationCurrency;
  string exchangeRate;
};

}  // namespace fxc::schema::queryresult
