#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "commandlineoption.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxc_vector.hpp"
#include "levenshteindistancecalculator.hpp"

namespace fxc {

// helper type for the visitor
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

/// Parses command line arguments into an aggregate of options, described by a list of options pointing to its members.
/// Supported member types are:
///  - std::string_view: the option expects a value
///  - bool: flag, set to true if present
template <class OptValueType>
class CommandLineOptionsParser {
 public:
  using CommandLineOptionType = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionType;
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;
  using value_type = OptValueType;

  template <std::size_t N>
  explicit CommandLineOptionsParser(const CommandLineOptionWithValue (&init)[N])
      : _opts(std::begin(init), std::end(init)) {
    std::ranges::stable_sort(_opts, [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  }

  /// Parses given arguments (program name excluded).
  /// invalid_argument is raised for unknown options or missing values.
  OptValueType parse(std::span<const char* const> arguments) const {
    OptValueType data;

    const int nbArgs = static_cast<int>(arguments.size());
    for (int argPos = 0; argPos < nbArgs; ++argPos) {
      std::string_view argStr(arguments[argPos]);

      const auto optIt = std::ranges::find_if(_opts, [argStr](const auto& opt) { return opt.first.matches(argStr); });
      if (optIt == _opts.end()) {
        invalidArgument(argStr);
      }

      const CommandLineOption& commandLineOption = optIt->first;
      const bool hasNextArg = argPos + 1 < nbArgs;

      std::visit(overloaded{
                     [&data](bool OptValueType::*arg) { data.*arg = true; },

                     [&data, &argPos, arguments, hasNextArg, &commandLineOption](std::string_view OptValueType::*arg) {
                       if (!hasNextArg) {
                         throw invalid_argument("Expecting a value for option {}", commandLineOption.fullName());
                       }
                       data.*arg = std::string_view(arguments[++argPos]);
                     },
                 },
                 optIt->second);
    }

    return data;
  }

  void displayHelp(std::string_view programName, std::ostream& stream) const {
    stream << "usage: " << programName << " <options>\n";
    if (_opts.empty()) {
      return;
    }
    stream << "Options:\n";

    const std::size_t lenTabRow = computeLenTabRow();
    std::string_view previousGroup;
    for (const auto& [opt, _] : _opts) {
      std::string_view currentGroup = opt.commandHeader().groupName();
      if (currentGroup != previousGroup) {
        stream << '\n' << ' ' << currentGroup << '\n';
        previousGroup = currentGroup;
      }
      std::size_t nbPrintedChars = 2U + opt.fullName().size();
      stream << "  " << opt.fullName();
      if (opt.hasShortName()) {
        stream << ", -" << opt.shortNameChar();
        nbPrintedChars += 4U;
      }
      if (!opt.valueDescription().empty()) {
        stream << ' ' << opt.valueDescription();
        nbPrintedChars += 1U + opt.valueDescription().size();
      }
      stream << std::string(lenTabRow - std::min(nbPrintedChars, lenTabRow - 1U), ' ') << opt.description() << '\n';
    }
  }

 private:
  std::size_t computeLenTabRow() const {
    std::size_t lenFirstRows = 0;
    for (const auto& [opt, _] : _opts) {
      std::size_t lenRows = 2U + opt.fullName().size() + 1U + opt.valueDescription().size();
      if (opt.hasShortName()) {
        lenRows += 4U;
      }
      lenFirstRows = std::max(lenFirstRows, lenRows);
    }
    return lenFirstRows + 3U;
  }

  [[noreturn]] void invalidArgument(std::string_view argStr) const {
    if (_opts.empty()) {
      throw invalid_argument("Unrecognized command-line option '{}'", argStr);
    }
    LevenshteinDistanceCalculator calc;
    std::string_view closestOptionStr;
    int minDistance = 0;
    for (const auto& [opt, _] : _opts) {
      const int distance = calc(opt.fullName(), argStr);
      if (closestOptionStr.empty() || distance < minDistance) {
        closestOptionStr = opt.fullName();
        minDistance = distance;
      }
    }

    if (minDistance <= 2 || minDistance < static_cast<int>(std::min(argStr.size(), closestOptionStr.size()) / 2)) {
      throw invalid_argument("Unrecognized command-line option '{}' - did you mean '{}'?", argStr, closestOptionStr);
    }
    throw invalid_argument("Unrecognized command-line option '{}'", argStr);
  }

  vector<CommandLineOptionWithValue> _opts;
};

}  // namespace fxc
