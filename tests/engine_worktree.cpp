#include "treefleet/refs.hpp"
#include "treefleet/repo.hpp"
#include "treefleet/status.hpp"
#include "treefleet/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string read_all(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  const fs::path base = fs::weakly_canonical(
      fs::temp_directory_path() /
      ("treefleet_engine_worktree_" + std::to_string(std::random_device{}())));
  const fs::path root = base / "primary";
  fs::create_directories(root);

  try {
    const treefleet::Identity who{.name = "User", .email = "u@example.com"};
    write_file(root / "README", "hello\n");
    write_file(root / "src/main.txt", "main\n");
    const auto primary = treefleet::Repository::init(root);
    const std::string c0 = primary.commit_all("initial", who);
    if (c0.size() != 40) {
      std::cerr << "initial commit missing\n";
      return 1;
    }
    if (primary.commit_all("again", who) != c0) {
      std::cerr << "commit without changes must return the same head\n";
      return 1;
    }

    // 1) add a linked worktree on a new branch
    const fs::path wt_path = base / "wts" / "agent-1";
    auto wt = treefleet::worktree::add_linked(primary, wt_path, "fleet/agent-1", "main");
    if (wt.head != c0 || read_all(wt_path / "README") != "hello\n" ||
        read_all(wt_path / "src/main.txt") != "main\n") {
      std::cerr << "linked worktree not checked out at base\n";
      return 1;
    }
    auto listed = treefleet::worktree::list_linked(primary);
    if (listed.size() != 1 || listed[0].path != wt_path || listed[0].branch != "fleet/agent-1") {
      std::cerr << "list_linked should report the new worktree\n";
      return 1;
    }

    // 2) opening from inside the worktree resolves the shared store
    const auto linked = treefleet::Repository::open(wt_path / "src");
    if (!linked.is_linked() || linked.common_dir() != primary.common_dir() ||
        linked.root() != wt_path) {
      std::cerr << "open through pointer file failed\n";
      return 1;
    }
    if (!treefleet::compute_status(linked).clean()) {
      std::cerr << "fresh worktree should be clean\n";
      return 1;
    }

    // 3) edit, status, commit; only the agent branch moves
    write_file(wt_path / "notes.txt", "work\n");
    fs::remove(wt_path / "README");
    const auto st = treefleet::compute_status(linked);
    if (st.clean() || st.untracked.size() != 1 || st.unstaged.size() != 1) {
      std::cerr << "expected one untracked and one deleted file\n";
      return 1;
    }
    const std::string c1 = linked.commit_all("agent work", who);
    if (c1 == c0 || !treefleet::compute_status(linked).clean()) {
      std::cerr << "commit in worktree failed\n";
      return 1;
    }
    if (treefleet::read_ref(primary.common_dir(), "refs/heads/fleet/agent-1") != c1 ||
        treefleet::read_ref(primary.common_dir(), "refs/heads/main") != c0) {
      std::cerr << "refs moved wrongly\n";
      return 1;
    }
    if (!treefleet::compute_status(primary).clean()) {
      std::cerr << "primary should not see worktree edits\n";
      return 1;
    }

    // 4) the same branch cannot be checked out twice; a non-empty destination is refused
    bool threw = false;
    try {
      treefleet::worktree::add_linked(primary, base / "wts" / "other", "fleet/agent-1", "main");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "branch checked out twice\n";
      return 1;
    }
    write_file(base / "wts" / "occupied" / "x", "x");
    threw = false;
    try {
      treefleet::worktree::add_linked(primary, base / "wts" / "occupied", "fleet/b", "main");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "non-empty destination accepted\n";
      return 1;
    }

    // 5) remove keeps the branch; adding again resumes it
    treefleet::worktree::remove_linked(primary, wt_path);
    if (fs::exists(wt_path) || !treefleet::worktree::list_linked(primary).empty()) {
      std::cerr << "remove_linked left state behind\n";
      return 1;
    }
    treefleet::worktree::remove_linked(primary, wt_path); // no-op
    if (!fs::exists(base / "wts" / "occupied" / "x")) {
      std::cerr << "foreign directory touched\n";
      return 1;
    }
    wt = treefleet::worktree::add_linked(primary, wt_path, "fleet/agent-1", "main");
    if (wt.head != c1 || !fs::exists(wt_path / "notes.txt") || fs::exists(wt_path / "README")) {
      std::cerr << "respawn should resume the agent branch\n";
      return 1;
    }

    // 6) a vanished directory is skipped and its admin entry reclaimed
    fs::remove_all(wt_path);
    if (!treefleet::worktree::list_linked(primary).empty()) {
      std::cerr << "vanished worktree still listed\n";
      return 1;
    }
    treefleet::worktree::add_linked(primary, wt_path, "fleet/agent-1", "main");

    threw = false;
    try {
      treefleet::worktree::add_linked(primary, base / "wts" / "bad", "fleet/bad", "no-such-ref");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "invalid base ref accepted\n";
      return 1;
    }

    std::cout << "engine_worktree OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
