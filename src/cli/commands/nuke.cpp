#include "cli/common.hpp"

#include <iostream>
#include <string>

int cmd_nuke(int argc, char **argv) {
  std::string agent;
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; a == "--force" || a == "-f") {
      force = true;
    } else if (agent.empty() && !a.starts_with("-")) {
      agent = a;
    } else {
      agent.clear();
      break;
    }
  }
  if (agent.empty()) {
    std::cerr << "usage: treefleet nuke <agent> [--force]\n";
    return treefleet::cli::kExitFailure;
  }

  try {
    const auto fleet = treefleet::cli::open_fleet();
    const auto outcome = fleet->nuke(agent, force);
    std::cout << agent
              << (outcome == treefleet::NukeOutcome::Removed ? " removed" : " already gone")
              << "\n";
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("nuke", e);
  }
}
