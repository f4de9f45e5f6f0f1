#include "cli/common.hpp"

#include "treefleet/config.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

int cmd_sync(int argc, char **argv) {
  std::vector<std::string> positional;
  std::optional<treefleet::Identity> author;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "--author") && i + 1 < argc) {
      author = treefleet::parse_identity(argv[++i]);
      if (!author) {
        std::cerr << "sync: --author wants \"Name <email>\"\n";
        return treefleet::cli::kExitFailure;
      }
    } else if ((a == "-m" || a == "--message") && i + 1 < argc) {
      positional.emplace_back(argv[++i]);
    } else {
      positional.push_back(std::move(a));
    }
  }
  if (positional.size() != 2 || positional[1].empty()) {
    std::cerr << "usage: treefleet sync <agent> <message> [--author \"Name <email>\"]\n";
    return treefleet::cli::kExitFailure;
  }

  try {
    const auto fleet = treefleet::cli::open_fleet();
    std::cout << fleet->sync(positional[0], positional[1], author) << "\n";
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("sync", e);
  }
}
