#pragma once

#include <optional>

#include "fxc_string.hpp"
#include "fxc_vector.hpp"

namespace fxc::schema {

/// One exchange rate entry of the rates file.
/// 'unitsPerBase' is a decimal string to keep its exact precision.
/// Validity bounds are ISO 8601 UTC time strings, both inclusive. An absent bound is unlimited.
struct RateEntry {
  string currency;
  string name;
  string unitsPerBase;
  std::optional<string> validFrom;
  std::optional<string> validTo;
};

struct RatesFile {
  vector<RateEntry> rates;
};

}  // namespace fxc::schema
