#pragma once
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace treefleet {

class Repository;
class ObjectStore;

namespace worktree {

using PathOidMap = std::map<std::string, std::string>; // path -> 40-hex blob id

// Regular files under root as repo-relative paths, skipping the ".treefleet" entry.
void enumerate_paths(const std::filesystem::path& root, std::set<std::string>& out_paths);

auto build_working_map(const std::filesystem::path& root) -> PathOidMap;
auto index_to_map(const std::filesystem::path& index_file) -> PathOidMap;
auto tree_to_map(const Repository& repo, const std::string& tree_hex) -> PathOidMap;

// Make work_root hold exactly the snapshot's files and record them in index_file.
void checkout_snapshot(const Repository& repo, const std::filesystem::path& work_root,
                       const std::filesystem::path& index_file, const PathOidMap& snapshot);

// A checkout linked to a primary repository.
struct LinkedWorktree {
  std::filesystem::path path;
  std::string name;            // admin entry under <common>/worktrees
  std::filesystem::path admin_dir;
  std::string branch;          // empty when HEAD is detached
  std::string head;            // empty when the branch has no commit
};

// Linked worktrees whose directory still exists. The primary checkout is not listed.
auto list_linked(const Repository& primary) -> std::vector<LinkedWorktree>;

// Create `path` on `branch`. A missing branch is created at `base_ref`; an existing branch that
// is not checked out anywhere is resumed where it points. Throws std::runtime_error if the
// directory is non-empty, the branch is checked out elsewhere, or base_ref does not resolve.
auto add_linked(const Repository& primary, const std::filesystem::path& path,
                const std::string& branch, const std::string& base_ref) -> LinkedWorktree;

// Delete the worktree directory and its admin entry; branch refs are kept. Only directories
// that point back at this repository are removed. No-op when nothing is there.
void remove_linked(const Repository& primary, const std::filesystem::path& path);

} // namespace worktree

} // namespace treefleet
