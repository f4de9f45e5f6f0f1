#include "cli/common.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <string>

namespace {

int cmd_help(int argc, char **argv) {
  if (argc < 2) {
    treefleet::cli::print_usage(std::cout);
    return treefleet::cli::kExitOk;
  }
  if (!treefleet::cli::print_command_usage(std::cout, argv[1])) {
    std::cerr << "help: no command named " << argv[1] << "\n";
    return treefleet::cli::kExitFailure;
  }
  return treefleet::cli::kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  treefleet::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    treefleet::cli::print_usage(std::cerr);
    return treefleet::cli::kExitFailure;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "--help" || cmd == "-h")
    return cmd_help(argc - 1, argv + 1);

  const auto fn = treefleet::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "treefleet: unknown command '" << cmd << "'\n";
    treefleet::cli::print_usage(std::cerr);
    return treefleet::cli::kExitFailure;
  }
  // The handler sees its own name as argv[0]
  return fn(argc - 1, argv + 1);
}
