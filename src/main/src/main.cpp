#include <cstdlib>
#include <exception>
#include <iostream>

#include "commandlineoptionsparser.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxconvoptions.hpp"
#include "fxconvoptionsdef.hpp"
#include "parseoptions.hpp"
#include "processconversionfromcli.hpp"

int main(int argc, const char* argv[]) {
  using namespace fxc;
  try {
    const auto parser =
        CommandLineOptionsParser<FxconvCmdLineOptions>(FxconvAllowedOptions<FxconvCmdLineOptions>::value);
    const auto [programName, cmdLineOptions] = ParseOptions(parser, argc, argv);

    if (cmdLineOptions) {
      ProcessConversionFromCLI(*cmdLineOptions);
    }
  } catch (const invalid_argument& e) {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
