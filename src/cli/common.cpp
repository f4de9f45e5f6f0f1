#include "cli/common.hpp"

#include "treefleet/errors.hpp"

#include <filesystem>
#include <iostream>

namespace treefleet::cli {

std::unique_ptr<Fleet> open_fleet() { return Fleet::open(std::filesystem::current_path()); }

int fail(const char *cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what() << "\n";
  const auto *fe = dynamic_cast<const FleetError *>(&e);
  if (!fe)
    return kExitFailure;
  switch (fe->kind()) {
  case ErrorKind::DirtyWorktreeRefusal:
    for (const auto &line : fe->changes())
      std::cerr << "  " << line << "\n";
    return kExitDirty;
  case ErrorKind::Timeout:
    return kExitTimeout;
  default:
    return kExitFailure;
  }
}

} // namespace treefleet::cli
