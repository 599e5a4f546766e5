#pragma once

#include <string_view>

#include "log-config.hpp"
#include "output-type.hpp"

namespace fxc {

namespace schema {

struct GeneralConfig {
  LogConfig log;
  OutputType outputType{OutputType::text};
};

}  // namespace schema

/// Reads the general configuration file from the data directory.
/// It is created with default values if it does not exist.
schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir);

}  // namespace fxc
