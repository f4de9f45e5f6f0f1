#pragma once
#include "treefleet/hash.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace treefleet {

struct Object {
  std::string type;               // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data; // payload, no header
};

// Loose object store shared by the primary and every linked worktree.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir) : objects_dir_(std::move(objects_dir)) {}

  Object read(std::string_view hex_oid) const;
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;
  bool contains(std::string_view hex_oid) const;

  std::filesystem::path path_for_oid(const oid &object_id) const;

private:
  std::filesystem::path objects_dir_;
};

} // namespace treefleet
