#pragma once
#include "treefleet/gateway.hpp"
#include "treefleet/repo.hpp"

#include <optional>
#include <string_view>

namespace treefleet {

// Gateway over an on-disk treefleet repository and its linked worktrees.
class NativeGateway : public RepositoryGateway {
public:
  void open(const std::filesystem::path& root) override;
  std::vector<WorktreeEntry> list_worktrees() override;
  void create_worktree(const std::filesystem::path& path, const std::string& branch,
                       const std::string& base_ref) override;
  void remove_worktree(const std::filesystem::path& path) override;
  StatusReport status(const std::filesystem::path& path) override;
  std::string commit(const std::filesystem::path& path, const std::string& message,
                     const Identity& author) override;
  std::string head_sha(const std::filesystem::path& path) override;

private:
  const Repository& primary(std::string_view primitive) const;
  // Open `path` as a linked worktree of the primary.
  Repository checkout(std::string_view primitive, const std::filesystem::path& path) const;

  std::optional<Repository> primary_;
};

} // namespace treefleet
