#include "treefleet/worktree.hpp"

#include "treefleet/fs.hpp"
#include "treefleet/index.hpp"
#include "treefleet/refs.hpp"
#include "treefleet/repo.hpp"
#include "treefleet/util.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>

namespace stdfs = std::filesystem;
namespace tfs = treefleet::fs;

namespace treefleet::worktree {

namespace {

stdfs::path normalized(const stdfs::path &p) { return stdfs::absolute(p).lexically_normal(); }

std::string read_line(const stdfs::path &p) {
  std::string s = tfs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

// True if path/.treefleet is a pointer file into this repository's worktree admin area.
bool points_into(const Repository &primary, const stdfs::path &path) {
  const auto pointer = path / consts::kMetaDir;
  std::error_code ec;
  if (!stdfs::is_regular_file(pointer, ec))
    return false;
  const std::string text = read_line(pointer);
  if (!text.starts_with(consts::kGitdirPrefix))
    return false;
  const auto admin = normalized(text.substr(consts::kGitdirPrefix.size()));
  return admin.parent_path() == normalized(primary.common_dir() / consts::kWorktreesDir);
}

void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                      const std::string &prefix, PathOidMap &out) {
  for (const auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = to_hex(e.id);
  }
}

} // namespace

void enumerate_paths(const stdfs::path &root, std::set<std::string> &out_paths) {
  for (auto it = stdfs::recursive_directory_iterator(root);
       it != stdfs::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (p.filename() == consts::kMetaDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file())
      continue;
    out_paths.insert(stdfs::relative(p, root).generic_string());
  }
}

PathOidMap build_working_map(const stdfs::path &root) {
  PathOidMap m;
  std::set<std::string> paths;
  enumerate_paths(root, paths);
  for (const auto &rel : paths)
    m[rel] = compute_blob_hex_oid(tfs::read_file(root / rel));
  return m;
}

PathOidMap index_to_map(const stdfs::path &index_file) {
  Index idx{index_file};
  idx.load();
  return idx.as_path_oid_map();
}

PathOidMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathOidMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

void checkout_snapshot(const Repository &repo, const stdfs::path &work_root,
                       const stdfs::path &index_file, const PathOidMap &snapshot) {
  std::set<std::string> working_paths;
  enumerate_paths(work_root, working_paths);
  for (const auto &p : working_paths) {
    if (!snapshot.contains(p))
      stdfs::remove(work_root / p);
  }
  for (const auto &[path, hex] : snapshot)
    tfs::write_file_atomic(work_root / path, repo.read_blob(hex));

  Index idx{index_file};
  idx.assign(snapshot);
  idx.save();
}

std::vector<LinkedWorktree> list_linked(const Repository &primary) {
  std::vector<LinkedWorktree> out;
  const auto admin_root = primary.common_dir() / consts::kWorktreesDir;
  if (!tfs::exists(admin_root))
    return out;

  for (const auto &entry : stdfs::directory_iterator(admin_root)) {
    if (!entry.is_directory())
      continue;
    const auto gitdir_file = entry.path() / consts::kGitdirFile;
    if (!tfs::exists(gitdir_file))
      continue;
    LinkedWorktree wt{.path = stdfs::path(read_line(gitdir_file)),
                      .name = entry.path().filename().string(),
                      .admin_dir = entry.path(),
                      .branch = {},
                      .head = {}};
    if (!tfs::exists(wt.path / consts::kMetaDir))
      continue; // directory vanished; add_linked reclaims the admin entry
    if (auto branch = head_branch(wt.admin_dir)) {
      wt.branch = *branch;
      wt.head = read_ref(primary.common_dir(), heads_ref(*branch)).value_or("");
    } else if (auto head = read_HEAD(wt.admin_dir)) {
      wt.head = *head;
      strutil::rstrip_newlines(wt.head);
    }
    out.push_back(std::move(wt));
  }
  std::ranges::sort(out, [](const auto &a, const auto &b) { return a.path < b.path; });
  return out;
}

LinkedWorktree add_linked(const Repository &primary, const stdfs::path &path_in,
                          const std::string &branch, const std::string &base_ref) {
  const auto path = normalized(path_in);
  if (branch.empty())
    throw std::runtime_error("worktree add: empty branch name");
  if (!tfs::is_absent_or_empty_dir(path))
    throw std::runtime_error("worktree add: destination is not empty: " + path.string());
  if (primary.current_branch() == branch)
    throw std::runtime_error("worktree add: branch '" + branch +
                             "' is checked out in the primary");
  for (const auto &wt : list_linked(primary)) {
    if (wt.branch == branch)
      throw std::runtime_error("worktree add: branch '" + branch + "' is checked out at " +
                               wt.path.string());
  }

  const std::string name = path.filename().string();
  const auto admin = primary.common_dir() / consts::kWorktreesDir / name;
  if (tfs::exists(admin)) {
    const auto gitdir_file = admin / consts::kGitdirFile;
    if (tfs::exists(gitdir_file) && tfs::exists(stdfs::path(read_line(gitdir_file)) / consts::kMetaDir))
      throw std::runtime_error("worktree add: name '" + name + "' is in use");
    tfs::remove_tree(admin);
  }

  const std::string ref = heads_ref(branch);
  std::string commit;
  if (auto existing = read_ref(primary.common_dir(), ref)) {
    commit = *existing;
  } else {
    auto resolved = primary.resolve(base_ref);
    if (!resolved)
      throw std::runtime_error("worktree add: invalid base ref '" + base_ref + "'");
    commit = *resolved;
    update_ref(primary.common_dir(), ref, commit);
  }

  stdfs::create_directories(admin);
  tfs::write_text_atomic(admin / consts::kGitdirFile, path.string() + "\n");
  tfs::write_text_atomic(admin / consts::kCommondirFile, "../..\n");
  set_HEAD_symbolic(admin, ref);

  stdfs::create_directories(path);
  tfs::write_text_atomic(path / consts::kMetaDir,
                         std::string(consts::kGitdirPrefix) + admin.string() + "\n");

  const auto info = primary.read_commit(commit);
  checkout_snapshot(primary, path, admin / consts::kIndexFile, tree_to_map(primary, info.tree_hex));

  return LinkedWorktree{
      .path = path, .name = name, .admin_dir = admin, .branch = branch, .head = commit};
}

void remove_linked(const Repository &primary, const stdfs::path &path_in) {
  const auto path = normalized(path_in);
  std::optional<stdfs::path> admin;

  const auto admin_root = primary.common_dir() / consts::kWorktreesDir;
  if (tfs::exists(admin_root)) {
    for (const auto &entry : stdfs::directory_iterator(admin_root)) {
      const auto gitdir_file = entry.path() / consts::kGitdirFile;
      if (tfs::exists(gitdir_file) && normalized(read_line(gitdir_file)) == path) {
        admin = entry.path();
        break;
      }
    }
  }
  if (points_into(primary, path) || (admin && tfs::is_absent_or_empty_dir(path)))
    tfs::remove_tree(path);
  else if (admin && tfs::exists(path))
    throw std::runtime_error("worktree remove: " + path.string() +
                             " does not point at this repository");
  if (admin)
    tfs::remove_tree(*admin);
}

} // namespace treefleet::worktree
