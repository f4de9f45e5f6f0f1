#include "cli/common.hpp"

#include "treefleet/config.hpp"
#include "treefleet/consts.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int cmd_init(int argc, char **argv) {
  std::optional<treefleet::Identity> author;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; a == "--author" && i + 1 < argc) {
      author = treefleet::parse_identity(argv[++i]);
      if (!author) {
        std::cerr << "init: --author wants \"Name <email>\"\n";
        return treefleet::cli::kExitFailure;
      }
    } else {
      std::cerr << "usage: treefleet init [--author \"Name <email>\"]\n";
      return treefleet::cli::kExitFailure;
    }
  }

  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const auto head = treefleet::Fleet::init(root, author);
    std::cout << "Initialized treefleet repository in " << (root / treefleet::consts::kMetaDir)
              << "\n";
    std::cout << head << "\n";
    return treefleet::cli::kExitOk;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("init", e);
  }
}
