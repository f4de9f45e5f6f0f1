#pragma once
#include <ostream>
#include <string>
#include "cli/command.hpp"

namespace treefleet::cli {

// `synopsis` is the argument list after the command name; `summary` is one line for the
// command table.
void register_command(const std::string& name, command_fn fn, const std::string& synopsis,
                      const std::string& summary);
command_fn find_command(const std::string& name);

void print_usage(std::ostream& out);
// False if `name` is not a registered command.
bool print_command_usage(std::ostream& out, const std::string& name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace treefleet::cli
