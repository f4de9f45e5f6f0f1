#include "cli/common.hpp"

#include "treefleet/consts.hpp"

#include <iostream>
#include <string>

int cmd_spawn(int argc, char **argv) {
  std::string agent;
  std::string base{treefleet::consts::kDefaultBranch};
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; a == "--base" && i + 1 < argc) {
      base = argv[++i];
    } else if (agent.empty() && !a.starts_with("-")) {
      agent = a;
    } else {
      agent.clear();
      break;
    }
  }
  if (agent.empty()) {
    std::cerr << "usage: treefleet spawn <agent> [--base <ref>]\n";
    return treefleet::cli::kExitFailure;
  }

  try {
    const auto fleet = treefleet::cli::open_fleet();
    const auto handle = fleet->spawn(agent, base);
    std::cout << handle.agent_id << " " << handle.branch << " " << handle.head_sha << "\n";
    std::cout << handle.path.string() << "\n";
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("spawn", e);
  }
}
