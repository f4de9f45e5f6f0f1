#include "cli/common.hpp"

#include <iostream>
#include <string>

int cmd_status(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: treefleet status <agent>\n";
    return treefleet::cli::kExitFailure;
  }
  const std::string agent = argv[1];

  try {
    const auto fleet = treefleet::cli::open_fleet();
    const auto st = fleet->status(agent);
    std::cout << agent << (st.clean ? " clean" : " dirty") << " at " << st.head_sha << "\n";
    for (const auto &line : st.changes)
      std::cout << "  " << line << "\n";
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("status", e);
  }
}
