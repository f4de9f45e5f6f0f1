#include "treefleet/repo.hpp"

#include "treefleet/fs.hpp"
#include "treefleet/index.hpp"
#include "treefleet/refs.hpp"
#include "treefleet/time.hpp"
#include "treefleet/util.hpp"
#include "treefleet/worktree.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <map>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>

namespace stdfs = std::filesystem;
namespace tfs   = treefleet::fs;

namespace {

[[nodiscard]] auto split_first(std::string_view path) -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos)
    return {std::string(path), std::string{}};
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

namespace treefleet {

Repository::Repository(stdfs::path root, stdfs::path common_dir, stdfs::path admin_dir)
    : root_(std::move(root)), common_dir_(std::move(common_dir)), admin_dir_(std::move(admin_dir)) {}

auto Repository::open(const stdfs::path& start) -> Repository {
  stdfs::path cur = stdfs::weakly_canonical(stdfs::absolute(start));
  for (;;) {
    const auto meta = cur / consts::kMetaDir;
    std::error_code ec;
    if (stdfs::is_directory(meta, ec)) {
      return Repository{cur, meta, meta};
    }
    if (stdfs::is_regular_file(meta, ec)) {
      std::string text = tfs::read_text(meta);
      strutil::rstrip_newlines(text);
      if (!text.starts_with(consts::kGitdirPrefix))
        throw std::runtime_error("malformed worktree pointer: " + meta.string());
      stdfs::path admin{text.substr(consts::kGitdirPrefix.size())};
      std::string rel = tfs::read_text(admin / consts::kCommondirFile);
      strutil::rstrip_newlines(rel);
      auto common = (admin / rel).lexically_normal();
      if (common.filename().empty()) // "a/b/../.." normalizes to "a/"
        common = common.parent_path();
      return Repository{cur, common, admin};
    }
    if (!cur.has_parent_path() || cur.parent_path() == cur)
      break;
    cur = cur.parent_path();
  }
  throw std::runtime_error("not a treefleet repository: " + start.string());
}

auto Repository::init(const stdfs::path& root, std::string_view branch) -> Repository {
  const auto abs_root = stdfs::weakly_canonical(stdfs::absolute(root));
  const auto meta = abs_root / consts::kMetaDir;
  if (tfs::exists(meta))
    throw std::runtime_error("a treefleet repository already exists at: " + meta.string());

  for (const auto& dir : {meta / consts::kObjectsDir, meta / consts::kRefsDir / consts::kHeadsDir,
                          meta / consts::kWorktreesDir}) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec)
      throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());
  }
  set_HEAD_symbolic(meta, heads_ref(branch));
  return Repository{abs_root, meta, meta};
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7')
      break;
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  auto [type, data] = store().read(hex_oid);
  if (type != consts::kTypeBlob)
    throw std::runtime_error("object is not a blob: " + std::string(hex_oid));
  return data;
}

// Trees

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries, [](const TreeEntry& a, const TreeEntry& b) { return a.name < b.name; });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }
  return store().write(consts::kTypeTree, as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = store().read(hex_oid);
  if (type != consts::kTypeTree)
    throw std::runtime_error("object is not a tree: " + std::string(hex_oid));

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();
  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end)
      throw std::runtime_error("tree parse: expected space");
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end)
      throw std::runtime_error("tree parse: expected NUL");
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen)
      throw std::runtime_error("tree parse: truncated oid");

    TreeEntry e{.mode = mode, .name = std::move(name), .id = {}};
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);
    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line, std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt.append(consts::kTreePrefix).append(tree_hex).push_back(consts::kLF);
  for (const auto& p : parent_hexes)
    txt.append(consts::kParentPrefix).append(p).push_back(consts::kLF);
  txt.append(consts::kAuthorPrefix).append(author_line).push_back(consts::kLF);
  txt.append(consts::kCommitterPrefix).append(committer_line).append("\n\n");
  txt.append(message);
  return store().write(consts::kTypeCommit, as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = store().read(commit_hex);
  if (obj.type != consts::kTypeCommit)
    throw std::runtime_error("object is not a commit: " + std::string(commit_hex));
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line = nl == std::string::npos ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      if (nl != std::string::npos)
        info.message = text.substr(nl + 1);
      break;
    }
    if (line.starts_with(consts::kTreePrefix))
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    else if (line.starts_with(consts::kParentPrefix))
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    else if (line.starts_with(consts::kAuthorPrefix))
      info.author = line.substr(consts::kAuthorPrefix.size());
    else if (line.starts_with(consts::kCommitterPrefix))
      info.committer = line.substr(consts::kCommitterPrefix.size());
    if (nl == std::string::npos)
      break;
    pos = nl + 1;
  }
  return info;
}

// Refs

auto Repository::current_branch() const -> std::optional<std::string> {
  return head_branch(admin_dir_);
}

auto Repository::head_commit() const -> std::optional<std::string> {
  auto head = read_HEAD(admin_dir_);
  if (!head)
    return std::nullopt;
  if (auto branch = head_branch(admin_dir_))
    return read_ref(common_dir_, heads_ref(*branch));
  std::string hex = *head;
  strutil::rstrip_newlines(hex);
  if (looks_hex40(hex))
    return hex;
  return std::nullopt;
}

auto Repository::resolve(std::string_view ref) const -> std::optional<std::string> {
  if (ref == consts::kHeadFile)
    return head_commit();
  if (looks_hex40(ref)) {
    const std::string hex(ref);
    if (store().contains(hex) && store().read(hex).type == consts::kTypeCommit)
      return hex;
    return std::nullopt;
  }
  if (ref.starts_with(consts::kHeadsPrefix))
    return read_ref(common_dir_, std::string(ref));
  return read_ref(common_dir_, heads_ref(ref));
}

// Index -> tree

auto Repository::write_tree_from_index() const -> std::string {
  Index idx{index_file()};
  idx.load();

  const auto build = [&](const auto& self, const std::vector<IndexEntry>& group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs;
    std::vector<TreeEntry> tree_entries;

    for (const auto& e : group) {
      auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = std::move(first), .id = e.oid});
      } else {
        IndexEntry child = e;
        child.path = std::move(rest);
        subdirs[first].push_back(std::move(child));
      }
    }

    for (const auto& [dirname, children] : subdirs) {
      TreeEntry te{.mode = consts::kModeTree, .name = dirname, .id = {}};
      if (!from_hex(self(self, children), te.id))
        throw std::runtime_error("bad subtree hex oid");
      tree_entries.push_back(std::move(te));
    }
    return write_tree(tree_entries);
  };

  return build(build, idx.entries());
}

auto Repository::commit_all(std::string_view message, const Identity& author) const -> std::string {
  const auto branch = current_branch();
  if (!branch)
    throw std::runtime_error("cannot commit on a detached HEAD in " + root_.string());

  Index idx{index_file()};
  idx.load();
  const auto working = worktree::build_working_map(root_);
  for (const auto& e : idx.as_path_oid_map()) {
    if (!working.contains(e.first))
      idx.remove_path(e.first);
  }
  const auto staged = idx.as_path_oid_map();
  const auto objects = store();
  for (const auto& [path, hex] : working) {
    const auto it = staged.find(path);
    if (it == staged.end() || it->second != hex)
      idx.add_path(root_, path, objects);
  }
  idx.save();

  const std::string tree_hex = write_tree_from_index();
  const auto head = head_commit();
  if (head && read_commit(*head).tree_hex == tree_hex)
    return *head;

  std::vector<std::string> parents;
  if (head)
    parents.push_back(*head);

  const std::string sig = timeutil::signature_now(author);
  std::string msg(message);
  if (msg.empty() || msg.back() != consts::kLF)
    msg.push_back(consts::kLF);
  const std::string commit_hex = write_commit(tree_hex, parents, sig, sig, msg);
  update_ref(common_dir_, heads_ref(*branch), commit_hex);
  return commit_hex;
}

} // namespace treefleet
