#include <sage/cli_exit_codes.h>
#include <sage/code_sage.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (arguments.empty() || arguments.front() == "--help" ||
        arguments.front() == "-h") {
      sage::PrintGlobalUsage(std::cout);
      return arguments.empty() ? sage::kExitError : sage::kExitClean;
    }

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    const auto &first = arguments.front();
    if (first == "analyze" || first == "report" || first == "init") {
      command = first;
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "report") {
      return sage::RunReport(command_arguments, std::cout);
    }
    if (command == "init") {
      return sage::RunInit(command_arguments, std::cout);
    }
    return sage::RunAnalyze(command_arguments, std::cout);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    sage::PrintGlobalUsage(std::cerr);
    return sage::kExitError;
  }
}
