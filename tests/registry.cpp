#include "treefleet/errors.hpp"
#include "treefleet/registry.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static treefleet::WorktreeRecord make_record(const std::string &agent, const std::string &path) {
  const auto now = std::chrono::system_clock::now();
  return treefleet::WorktreeRecord{.agent_id = agent,
                                   .path = path,
                                   .branch = "fleet/" + agent,
                                   .base_ref = "main",
                                   .state = treefleet::WorktreeState::Spawning,
                                   .created_at = now,
                                   .last_transition_at = now,
                                   .head_sha = {}};
}

template <class Fn> static std::optional<treefleet::ErrorKind> kind_of(Fn &&fn) {
  try {
    fn();
  } catch (const treefleet::FleetError &e) {
    return e.kind();
  }
  return std::nullopt;
}

int main() {
  using treefleet::WorktreeState;
  const fs::path dir = fs::temp_directory_path() /
                       ("treefleet_registry_" + std::to_string(std::random_device{}()));

  try {
    {
      treefleet::WorktreeRegistry reg{dir};
      reg.load();
      reg.insert(make_record("a", "/w/a"));
      reg.transition("a", WorktreeState::Active, std::string(40, '1'));
      reg.insert(make_record("b", "/w/b"));

      // collisions are refused without touching disk
      auto clash = make_record("c", "/w/a");
      if (kind_of([&] { reg.insert(clash); }) != treefleet::ErrorKind::PathCollision) {
        std::cerr << "expected PathCollision\n";
        return 1;
      }
      clash = make_record("c", "/w/c");
      clash.branch = "fleet/b";
      if (kind_of([&] { reg.insert(clash); }) != treefleet::ErrorKind::BranchCollision) {
        std::cerr << "expected BranchCollision\n";
        return 1;
      }
      if (fs::exists(dir / "c")) {
        std::cerr << "refused insert wrote a file\n";
        return 1;
      }

      bool threw = false;
      try {
        reg.transition("a", WorktreeState::Spawning);
      } catch (const std::logic_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "backward transition accepted\n";
        return 1;
      }
    }

    // survives a restart
    {
      treefleet::WorktreeRegistry reg{dir};
      reg.load();
      const auto a = reg.find("a");
      if (!a || a->state != WorktreeState::Active || a->head_sha != std::string(40, '1') ||
          a->path != "/w/a" || reg.records().size() != 2) {
        std::cerr << "records not persisted\n";
        return 1;
      }

      // compare-and-set only fires from the expected state
      if (reg.transition_if("a", WorktreeState::Dirty, WorktreeState::Active)) {
        std::cerr << "transition_if ignored the expected state\n";
        return 1;
      }
      if (!reg.transition_if("a", WorktreeState::Active, WorktreeState::Dirty)) {
        std::cerr << "transition_if did not fire\n";
        return 1;
      }

      // Orphaned can only be left through resolve_orphan
      reg.transition("b", WorktreeState::Orphaned);
      if (kind_of([&] { reg.transition("b", WorktreeState::Active); }) !=
          treefleet::ErrorKind::OrphanDetected) {
        std::cerr << "Orphaned record moved by a plain transition\n";
        return 1;
      }
      if (reg.resolve_orphan("b", WorktreeState::Active).state != WorktreeState::Active) {
        std::cerr << "resolve_orphan failed\n";
        return 1;
      }

      reg.purge("b");
      if (reg.find("b") || fs::exists(dir / "b")) {
        std::cerr << "purge left the record\n";
        return 1;
      }
    }

    // corruption: unparseable file, wrong agent name, two claims on one path
    {
      std::ofstream(dir / "junk") << "this is not a record\n";
      auto stray = make_record("someone-else", "/w/x");
      std::ofstream(dir / "x") << treefleet::serialize_record(stray);
      auto dup = make_record("d", "/w/a");
      std::ofstream(dir / "d") << treefleet::serialize_record(dup);

      treefleet::WorktreeRegistry reg{dir};
      reg.load();
      const auto corrupt = reg.corrupt_agents();
      if (!corrupt.contains("junk") || !corrupt.contains("x") || !corrupt.contains("d") ||
          !corrupt.contains("a")) {
        std::cerr << "corruption not detected\n";
        return 1;
      }
      if (!reg.find("a") || reg.is_corrupt("b")) {
        std::cerr << "corrupt agents should still be visible, others untouched\n";
        return 1;
      }
    }

    // a mark survives reloads until the mark file is deleted
    {
      treefleet::WorktreeRegistry reg{dir};
      reg.load();
      reg.insert(make_record("m", "/w/m"));
      reg.mark_corrupt("m", "worktree is on branch other");

      treefleet::WorktreeRegistry again{dir};
      again.load();
      if (again.corruption("m") != "worktree is on branch other" || !again.find("m")) {
        std::cerr << "corruption mark lost on reload\n";
        return 1;
      }
      fs::remove(dir / ".corrupt" / "m");
      again.load();
      if (again.is_corrupt("m")) {
        std::cerr << "deleting the mark should clear it\n";
        return 1;
      }
    }

    std::cout << "registry OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
