#include <citegraph/citegraph_cli.h>

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: citegraph <command> [options]\n\n"
      << "Commands:\n"
      << "  build     Build the citation graph of a corpus (default if no\n"
      << "            command is given).\n"
      << "  show      Print one record of a built corpus.\n"
      << "  stats     Print the corpus_info record of a built corpus.\n"
      << "  adapters  List the available corpus adapters.\n\n"
      << "Run 'citegraph <command> --help' for command options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (arguments.empty() || arguments.front() == "--help" ||
        arguments.front() == "-h") {
      PrintGlobalUsage();
      return arguments.empty() ? 1 : 0;
    }

    std::string command = "build";
    std::size_t first_argument_index = 0;
    if (arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "build") {
      return citegraph::RunBuild(command_arguments);
    }
    if (command == "show") {
      return citegraph::RunShow(command_arguments);
    }
    if (command == "stats") {
      return citegraph::RunStats(command_arguments);
    }
    if (command == "adapters") {
      return citegraph::RunAdapters(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
