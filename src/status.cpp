#include "treefleet/status.hpp"

#include "treefleet/repo.hpp"
#include "treefleet/worktree.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace treefleet {

namespace {

using PathMap = std::map<std::string, std::string>;

// Changes from `base` to `next`; paths only in `base` are deletions.
void diff_maps(const PathMap &base, const PathMap &next, bool report_added,
               std::vector<Change> &out) {
  std::set<std::string> all;
  for (const auto &[p, _] : base)
    all.insert(p);
  for (const auto &[p, _] : next)
    all.insert(p);

  for (const auto &path : all) {
    const auto it_b = base.find(path);
    const auto it_n = next.find(path);
    const bool in_b = it_b != base.end();
    const bool in_n = it_n != next.end();
    if (in_b && in_n) {
      if (it_b->second != it_n->second)
        out.push_back({ChangeKind::Modified, path});
    } else if (in_n) {
      if (report_added)
        out.push_back({ChangeKind::Added, path});
    } else {
      out.push_back({ChangeKind::Deleted, path});
    }
  }
}

char code_for(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return 'A';
  case ChangeKind::Modified:
    return 'M';
  case ChangeKind::Deleted:
    return 'D';
  }
  return '?';
}

} // namespace

Status compute_status(const Repository &repo) {
  PathMap head_map;
  if (auto head = repo.head_commit())
    head_map = worktree::tree_to_map(repo, repo.read_commit(*head).tree_hex);
  const PathMap index_map = worktree::index_to_map(repo.index_file());
  const PathMap work_map = worktree::build_working_map(repo.root());

  Status st;
  diff_maps(head_map, index_map, true, st.staged);
  // new working files are untracked, not unstaged additions
  diff_maps(index_map, work_map, false, st.unstaged);
  for (const auto &[p, _] : work_map) {
    if (!index_map.contains(p))
      st.untracked.push_back(p);
  }
  std::ranges::sort(st.untracked);
  return st;
}

std::vector<std::string> summarize(const Status &st) {
  std::vector<std::string> lines;
  for (const auto &c : st.staged)
    lines.push_back(std::string(1, code_for(c.kind)) + "  " + c.path);
  for (const auto &c : st.unstaged)
    lines.push_back(std::string(1, code_for(c.kind)) + "  " + c.path);
  for (const auto &p : st.untracked)
    lines.push_back("?  " + p);
  return lines;
}

} // namespace treefleet
