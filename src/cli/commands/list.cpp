#include "cli/common.hpp"

#include <iostream>

int cmd_list(int /*argc*/, char ** /*argv*/) {
  try {
    const auto fleet = treefleet::cli::open_fleet();
    for (const auto &rec : fleet->records()) {
      std::cout << rec.agent_id << "  " << treefleet::to_string(rec.state) << "  " << rec.branch
                << "  " << (rec.head_sha.empty() ? "-" : rec.head_sha.substr(0, 7)) << "  "
                << rec.path.string() << "\n";
    }
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("list", e);
  }
}
