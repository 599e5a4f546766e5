#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <span>
#include <utility>

#include "fxc_string.hpp"
#include "fxconvoptions.hpp"

namespace fxc {

template <class OptValueType>
struct ParsedOptions {
  string programName;
  // empty if there is nothing more to do (help or version has been printed)
  std::optional<OptValueType> options;
};

/// Parses the command line arguments with given parser.
/// Help is printed if requested or if there is no argument at all, version if requested.
/// invalid_argument is raised for invalid options.
template <class ParserType>
auto ParseOptions(const ParserType &parser, int argc, const char *argv[], std::ostream &os = std::cout) {
  using OptValueType = ParserType::value_type;

  ParsedOptions<OptValueType> parsedOptions{std::filesystem::path(argv[0]).filename().string(), std::nullopt};

  std::span<const char *const> allArguments(argv, static_cast<std::size_t>(argc));

  // skip first argument which is program name
  auto arguments = allArguments.last(allArguments.size() - 1U);

  OptValueType options = parser.parse(arguments);

  if (arguments.empty()) {
    options.help = true;
  }
  if (options.help) {
    parser.displayHelp(parsedOptions.programName, os);
  } else if (options.version) {
    OptValueType::PrintVersion(parsedOptions.programName, os);
  } else {
    parsedOptions.options = std::move(options);
  }

  return parsedOptions;
}

}  // namespace fxc
