#include "cli/common.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_all(const char *action, const std::vector<std::string> &items) {
  for (const auto &item : items)
    std::cout << action << " " << item << "\n";
}

} // namespace

int cmd_reconcile(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: treefleet reconcile\n";
    return treefleet::cli::kExitFailure;
  }

  try {
    const auto fleet = treefleet::cli::open_fleet();
    const auto report = fleet->reconcile();

    print_all("purged", report.purged);
    print_all("orphaned", report.orphaned);
    print_all("adopted", report.adopted);
    print_all("removed", report.removed);
    print_all("foreign", report.foreign);
    print_all("retried", report.completed);
    print_all("orphaned", report.escalated);
    print_all("orphaned", report.outstanding);
    print_all("pending", report.pending);
    for (const auto &[agent, reason] : report.corrupt)
      std::cout << "corrupt " << agent << ": " << reason << "\n";
    for (const auto &failure : report.failures)
      std::cerr << "reconcile: " << failure << "\n";

    std::cout << report.orphans() << " orphan(s), " << report.stale() << " stale, "
              << report.corrupt.size() << " corrupt, "
              << (report.changed() ? "registry updated" : "nothing to do") << "\n";
    return report.corrupt.empty() && report.failures.empty() ? treefleet::cli::kExitOk
                                                             : treefleet::cli::kExitFailure;
  } catch (const std::exception &e) {
    return treefleet::cli::fail("reconcile", e);
  }
}
