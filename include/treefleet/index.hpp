#pragma once
#include "treefleet/consts.hpp"
#include "treefleet/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet {

class ObjectStore;

struct IndexEntry {
  std::uint32_t mode;  // consts::kModeFile
  treefleet::oid oid;  // blob id
  std::string   path;  // "dir/file", no leading '/'
};

// Staging area of one worktree. Text format: "<octal> <hex> <path>" per line.
class Index {
public:
  explicit Index(std::filesystem::path index_file);

  // No throw if the file is missing.
  void load();
  void save() const;

  // Hash work_root/relpath into the store and add or replace its entry.
  void add_path(const std::filesystem::path& work_root,
                std::string_view relpath,
                const ObjectStore& store,
                std::uint32_t mode = consts::kModeFile);

  void remove_path(std::string_view relpath);

  // Replace all entries with path -> 40-hex blob id pairs.
  void assign(const std::map<std::string, std::string>& path_oids,
              std::uint32_t mode = consts::kModeFile);

  const std::vector<IndexEntry>& entries() const { return entries_; }
  std::map<std::string, std::string> as_path_oid_map() const;

private:
  void sort_entries();

  std::filesystem::path index_file_;
  std::vector<IndexEntry> entries_;
};

} // namespace treefleet
