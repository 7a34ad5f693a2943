#include <cq/cli_exit_codes.h>
#include <cq/cq_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: cq <command> [options]\n\n"
      << "Commands:\n"
      << "  analyze         Score a repository (default if no command is "
         "given).\n"
      << "  example-config  Print the default YAML configuration.\n\n"
      << "Run 'cq analyze --help' for analysis options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return cq::kExitComplete;
    }

    std::string command = "analyze";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "analyze") {
      return cq::RunAnalyze(command_arguments);
    }
    if (command == "example-config") {
      return cq::RunExampleConfig(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return cq::kExitError;
  }
}
