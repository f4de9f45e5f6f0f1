#pragma once
#include "treefleet/config.hpp"
#include "treefleet/consts.hpp"
#include "treefleet/hash.hpp"
#include "treefleet/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet {

struct TreeEntry {
  std::uint32_t mode; // consts::kModeFile or consts::kModeTree
  std::string name;   // no '/'
  oid id;
};

struct CommitInfo {
  std::string tree_hex;
  std::vector<std::string> parents;
  std::string author;    // line after "author "
  std::string committer; // line after "committer "
  std::string message;
};

// One checkout of a treefleet repository: the primary, or a linked worktree that shares the
// primary's objects and refs (common dir) but keeps its own HEAD and index (admin dir).
class Repository {
public:
  // Walk up from `start` to the nearest ".treefleet" dir (primary) or pointer file (linked).
  static Repository open(const std::filesystem::path& start);

  // Create a primary at `root`. Throws if one already exists.
  static Repository init(const std::filesystem::path& root,
                         std::string_view branch = consts::kDefaultBranch);

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] const std::filesystem::path& common_dir() const { return common_dir_; }
  [[nodiscard]] const std::filesystem::path& admin_dir() const { return admin_dir_; }
  [[nodiscard]] bool is_linked() const { return common_dir_ != admin_dir_; }
  [[nodiscard]] auto primary_root() const -> std::filesystem::path { return common_dir_.parent_path(); }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path { return common_dir_ / consts::kObjectsDir; }
  [[nodiscard]] auto index_file() const -> std::filesystem::path { return admin_dir_ / consts::kIndexFile; }
  [[nodiscard]] auto store() const -> ObjectStore { return ObjectStore{objects_dir()}; }

  // Object plumbing
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;
  [[nodiscard]] auto write_tree(const std::vector<TreeEntry>& entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;
  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string>& parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Branch name, "HEAD", "refs/heads/<x>" or a 40-hex commit id -> commit id.
  [[nodiscard]] auto resolve(std::string_view ref) const -> std::optional<std::string>;
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;
  [[nodiscard]] auto current_branch() const -> std::optional<std::string>;

  [[nodiscard]] auto write_tree_from_index() const -> std::string;

  // Stage every working file (dropping deleted ones) and commit on the current branch.
  // Returns the existing head when the staged tree equals HEAD's tree.
  auto commit_all(std::string_view message, const Identity& author) const -> std::string;

private:
  Repository(std::filesystem::path root, std::filesystem::path common_dir,
             std::filesystem::path admin_dir);

  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  std::filesystem::path common_dir_;
  std::filesystem::path admin_dir_;
};

} // namespace treefleet
