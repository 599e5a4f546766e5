#pragma once

#include <compare>
#include <string_view>
#include <utility>
#include <variant>

namespace fxc {

/// Group of command line options, used to organize the help.
class CommandHeader {
 public:
  constexpr CommandHeader() noexcept = default;

  constexpr CommandHeader(std::string_view groupName, int prio) : _prio(prio), _groupName(groupName) {}

  constexpr std::string_view groupName() const { return _groupName; }

  constexpr int prio() const { return _prio; }

  constexpr std::strong_ordering operator<=>(const CommandHeader&) const = default;

 private:
  // _prio first for the default spaceship operator
  int _prio = 0;
  std::string_view _groupName;
};

/// Description of a command line option.
class CommandLineOption {
 public:
  constexpr CommandLineOption() noexcept = default;

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, char shortName,
                              std::string_view valueDescription, std::string_view description)
      : _commandHeader(commandHeader),
        _fullName(fullName),
        _valueDescription(valueDescription),
        _description(description),
        _shortName(shortName) {}

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, std::string_view valueDescription,
                              std::string_view description)
      : CommandLineOption(commandHeader, fullName, '\0', valueDescription, description) {}

  /// Returns true if given argument designates this option, by its full name or its short name ('-x').
  constexpr bool matches(std::string_view optName) const {
    if (hasShortName() && optName.size() == 2 && optName.front() == '-' && optName.back() == _shortName) {
      return true;
    }
    return optName == _fullName;
  }

  constexpr const CommandHeader& commandHeader() const { return _commandHeader; }
  constexpr std::string_view fullName() const { return _fullName; }
  constexpr std::string_view valueDescription() const { return _valueDescription; }
  constexpr std::string_view description() const { return _description; }

  constexpr char shortNameChar() const { return _shortName; }

  constexpr bool hasShortName() const { return _shortName != '\0'; }

  constexpr std::strong_ordering operator<=>(const CommandLineOption&) const = default;

 private:
  CommandHeader _commandHeader;
  std::string_view _fullName;
  std::string_view _valueDescription;
  std::string_view _description;
  char _shortName = '\0';
};

template <class OptValueType>
struct AllowedCommandLineOptionsBase {
  using CommandLineOptionType = std::variant<std::string_view OptValueType::*, bool OptValueType::*>;
  using CommandLineOptionWithValue = std::pair<CommandLineOption, CommandLineOptionType>;
};

}  // namespace fxc
